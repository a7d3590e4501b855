#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

using Json = nlohmann::json;

struct ChatCommand {
    std::string verb;                     // without '/' and without "@botname"
    std::string argument;                 // words after the verb, single-spaced
    std::string originator;               // chat id
    std::optional<std::string> locale;    // sender's language_code
    std::optional<std::string> addressee; // lower-case "botname" of "/verb@botname"
};

/**
 * @brief Extracts a bot command from a Telegram update.
 *
 * Returns std::nullopt for anything that is not a text message starting with
 * '/' (edits, callbacks, plain chat, malformed envelopes).
 */
std::optional<ChatCommand> parseChatCommand(const Json& update);
