#include "chat_update.hpp"
#include "utils.hpp"

std::optional<ChatCommand> parseChatCommand(const Json& update) {
    if (!update.is_object() || !update.contains("message")) return std::nullopt;

    const Json& message = update["message"];
    if (!message.is_object()) return std::nullopt;

    auto text = message.find("text");
    if (text == message.end() || !text->is_string()) return std::nullopt;

    auto chat = message.find("chat");
    if (chat == message.end() || !chat->is_object() || !chat->contains("id")) return std::nullopt;

    const Json& chatId = (*chat)["id"];
    std::string originator;
    if (chatId.is_number_integer()) {
        originator = std::to_string(chatId.get<int64_t>());
    } else if (chatId.is_string()) {
        originator = chatId.get<std::string>();
    } else {
        return std::nullopt;
    }

    std::string body = Utils::trim(text->get<std::string>());
    if (body.size() < 2 || body[0] != '/') return std::nullopt;

    auto space = body.find_first_of(" \t\n");
    std::string verb = body.substr(1, space == std::string::npos ? std::string::npos : space - 1);
    std::optional<std::string> addressee;
    auto at = verb.find('@');
    if (at != std::string::npos) {
        addressee = Utils::toLower(verb.substr(at + 1));
        verb.resize(at);
    }
    if (verb.empty()) return std::nullopt;

    ChatCommand command;
    command.addressee = addressee;
    command.verb = Utils::toLower(verb);
    command.argument = space == std::string::npos ? "" : Utils::joinWords(body.substr(space));
    command.originator = originator;

    auto from = message.find("from");
    if (from != message.end() && from->is_object()) {
        auto language = from->find("language_code");
        if (language != from->end() && language->is_string()) {
            command.locale = language->get<std::string>();
        }
    }
    return command;
}
