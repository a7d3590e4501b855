#undef NDEBUG
#include "message_catalog.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <assert.h>

int main() {
    MessageCatalog catalog;

    /* Locale resolution.  */
    assert(catalog.resolveLocale(std::nullopt) == "en");
    assert(catalog.resolveLocale(std::string("en")) == "en");
    assert(catalog.resolveLocale(std::string("en-US")) == "en");
    assert(catalog.resolveLocale(std::string("zh-hans")) == "zh");
    assert(catalog.resolveLocale(std::string("ZH_TW")) == "zh");
    assert(catalog.resolveLocale(std::string("fr")) == "en");
    assert(catalog.resolveLocale(std::string("")) == "en");

    /* Placeholders are substituted everywhere they appear.  */
    {
        auto text = catalog.render(MessageId::Welcome, std::nullopt, {{"command", "vtuber"}});
        assert(contains(text, "`/vtuber <description>`"));
        assert(contains(text, "`/vtuber a silver-haired girl"));
        assert(!contains(text, "{command}"));
    }
    {
        auto text = catalog.render(MessageId::JobCompleted, std::string("zh"),
                                   {{"job_id", "J1"}, {"result_url", "https://x.example/J1.zip"}});
        assert(contains(text, "`J1`"));
        assert(contains(text, "https://x.example/J1.zip"));
        assert(contains(text, "已完成"));
    }

    /* Values cannot open or close Markdown entities.  */
    {
        auto text = catalog.render(MessageId::JobCompleted, std::string("en"),
                                   {{"job_id", "J`1_x"}, {"result_url", "https://h/out_put_1.zip"}});
        assert(contains(text, "`J'1_x`"));
        assert(contains(text, "https://h/out\\_put\\_1.zip"));
        assert(std::count(text.begin(), text.end(), '`') == 2);

        text = catalog.render(MessageId::JobStatusReport, std::nullopt,
                              {{"job_id", "J2"}, {"status", "AWAITING_PAYMENT"}});
        assert(contains(text, "`J2`: AWAITING\\_PAYMENT"));

        text = catalog.render(MessageId::EmptyPrompt, std::nullopt, {{"command", "a`b"}});
        assert(contains(text, "`/a'b "));

        text = catalog.render(MessageId::PaymentLink, std::nullopt,
                              {{"job_id", "J3"}, {"amount", "9.90"}, {"currency", "C*NY"},
                               {"payment_url", "https://pay.example/submit_(1).php?a=b_c"}});
        assert(contains(text, "[Pay 9.90 CNY](https://pay.example/submit_%281%29.php?a=b_c)"));
    }

    /* Every message exists in every language.  */
    for (auto id : {MessageId::Welcome, MessageId::Help, MessageId::EmptyPrompt, MessageId::JobQueued,
                    MessageId::PaymentRequired, MessageId::PaymentLink, MessageId::PaymentConfirmed, MessageId::JobCompleted,
                    MessageId::JobCompletedNoArtifact, MessageId::JobFailed, MessageId::JobTimedOut,
                    MessageId::JobStatusReport, MessageId::JobNotFound}) {
        assert(!catalog.render(id, std::string("en"), {{"job_id", "J"}}).empty());
        assert(!catalog.render(id, std::string("zh"), {{"job_id", "J"}}).empty());
        assert(catalog.render(id, std::string("en")) != catalog.render(id, std::string("zh")));
    }

    /* Unknown placeholders are left alone.  */
    assert(contains(catalog.render(MessageId::JobFailed, std::nullopt), "{job_id}"));

    return 0;
}
