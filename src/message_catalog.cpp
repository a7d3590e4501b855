#include "message_catalog.hpp"
#include "utils.hpp"

namespace {

const char* kDefaultLocale = "en";

std::map<MessageId, std::string> englishTemplates() {
    return {
        {MessageId::Welcome,
         "Hello! Welcome to the AI drawing bot.\n\n"
         "Use `/{command} <description>` to submit a drawing job.\n"
         "Example: `/{command} a silver-haired girl in a cyberpunk jacket`\n\n"
         "Submitted jobs are queued, please be patient."},
        {MessageId::Help,
         "Available commands:\n"
         "/start - show the welcome message\n"
         "/help - show this help\n"
         "/{command} <description> - create a VTuber model from your description\n"
         "/status <job id> - show the status of one of your jobs"},
        {MessageId::EmptyPrompt,
         "Please enter a description. Example: `/{command} a girl wearing a cat-ear hat`"},
        {MessageId::JobQueued,
         "✅ Job submitted, waiting in the queue for a compute node...\n\nJob ID: `{job_id}`"},
        {MessageId::PaymentRequired,
         "🧾 Job created. Scan the code to pay {amount} {currency} and start it.\n\nJob ID: `{job_id}`"},
        {MessageId::PaymentLink,
         "🧾 Job created. [Pay {amount} {currency}]({payment_url}) to start it.\n\nJob ID: `{job_id}`"},
        {MessageId::PaymentConfirmed,
         "💰 Payment received for job `{job_id}`, it is now queued for a compute node."},
        {MessageId::JobCompleted,
         "🎉 Your job `{job_id}` is complete!\n\nDownload your model here:\n{result_url}"},
        {MessageId::JobCompletedNoArtifact,
         "🎉 Your job `{job_id}` is complete!"},
        {MessageId::JobFailed,
         "Sorry, your job `{job_id}` failed."},
        {MessageId::JobTimedOut,
         "Sorry, your job `{job_id}` took too long on the compute node and was marked as failed."},
        {MessageId::JobStatusReport,
         "Job `{job_id}`: {status}"},
        {MessageId::JobNotFound,
         "No job `{job_id}` was found."},
    };
}

std::map<MessageId, std::string> chineseTemplates() {
    return {
        {MessageId::Welcome,
         "你好! 欢迎使用 AI 绘图机器人。\n\n"
         "使用 `/{command} <描述>` 来提交一个画图任务。\n"
         "例如: `/{command} 一个穿着赛博朋克夹克的银发女孩`\n\n"
         "任务提交后将进入队列，请耐心等待处理。"},
        {MessageId::Help,
         "可用命令:\n"
         "/start - 显示欢迎信息\n"
         "/help - 显示此帮助信息\n"
         "/{command} <描述> - 根据您的文字描述创建一个VTuber模型\n"
         "/status <任务ID> - 查询任务状态"},
        {MessageId::EmptyPrompt,
         "请输入您的描述。例如: `/{command} 一个戴着猫耳帽子的女孩`"},
        {MessageId::JobQueued,
         "✅ 任务已成功提交，正在排队等待计算节点处理...\n\n任务ID: `{job_id}`"},
        {MessageId::PaymentRequired,
         "🧾 任务已创建，请扫码支付 {amount} {currency} 以开始处理。\n\n任务ID: `{job_id}`"},
        {MessageId::PaymentLink,
         "🧾 任务已创建，请[点击支付 {amount} {currency}]({payment_url})以开始处理。\n\n任务ID: `{job_id}`"},
        {MessageId::PaymentConfirmed,
         "💰 已收到任务 `{job_id}` 的付款，正在排队等待计算节点处理。"},
        {MessageId::JobCompleted,
         "🎉 您的任务 `{job_id}` 已完成！\n\n请点击以下链接下载您的模型：\n{result_url}"},
        {MessageId::JobCompletedNoArtifact,
         "🎉 您的任务 `{job_id}` 已完成！"},
        {MessageId::JobFailed,
         "很抱歉，您的任务 `{job_id}` 执行失败了。"},
        {MessageId::JobTimedOut,
         "很抱歉，您的任务 `{job_id}` 处理超时，已标记为失败。"},
        {MessageId::JobStatusReport,
         "任务 `{job_id}`: {status}"},
        {MessageId::JobNotFound,
         "未找到任务 `{job_id}`。"},
    };
}

// Where a placeholder sits in a legacy-Markdown template
enum class Context {
    Plain,
    Code,          // between backticks
    LinkText,      // [...]
    LinkTarget     // (...) after a link text
};

// Makes `value` unable to open or close an entity in its context.
std::string escapeFor(Context context, const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (context) {
            case Context::Code:
                out += c == '`' ? '\'' : c;
                break;
            case Context::LinkText:
                if (c != '_' && c != '*' && c != '`' && c != '[' && c != ']') out += c;
                break;
            case Context::LinkTarget:
                if (c == '(') out += "%28";
                else if (c == ')') out += "%29";
                else out += c;
                break;
            case Context::Plain:
                if (c == '_' || c == '*' || c == '`' || c == '[') out += '\\';
                out += c;
                break;
        }
    }
    return out;
}

// Single pass over the template, so substituted text never changes the context.
std::string substitute(const std::string& text, const MessageArgs& args) {
    std::string out;
    Context context = Context::Plain;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '{') {
            auto close = text.find('}', i);
            if (close != std::string::npos) {
                auto arg = args.find(text.substr(i + 1, close - i - 1));
                if (arg != args.end()) {
                    out += escapeFor(context, arg->second);
                    i = close;
                    continue;
                }
            }
        }

        if (c == '`' && (context == Context::Plain || context == Context::Code)) {
            context = context == Context::Code ? Context::Plain : Context::Code;
        } else if (c == '[' && context == Context::Plain) {
            context = Context::LinkText;
        } else if (c == ']' && context == Context::LinkText) {
            if (i + 1 < text.size() && text[i + 1] == '(') {
                out += "](";
                ++i;
                context = Context::LinkTarget;
                continue;
            }
            context = Context::Plain;
        } else if (c == ')' && context == Context::LinkTarget) {
            context = Context::Plain;
        }
        out += c;
    }
    return out;
}

}

MessageCatalog::MessageCatalog() {
    templates_["en"] = englishTemplates();
    templates_["zh"] = chineseTemplates();
}

std::string MessageCatalog::resolveLocale(const std::optional<std::string>& tag) const {
    if (!tag) return kDefaultLocale;

    std::string lang = Utils::toLower(Utils::trim(*tag));
    auto dash = lang.find_first_of("-_");
    if (dash != std::string::npos) lang.resize(dash);

    return templates_.contains(lang) ? lang : kDefaultLocale;
}

std::string MessageCatalog::render(MessageId id, const std::optional<std::string>& locale, const MessageArgs& args) const {
    const auto& table = templates_.at(resolveLocale(locale));
    auto it = table.find(id);
    if (it == table.end()) {
        it = templates_.at(kDefaultLocale).find(id);
    }
    return substitute(it->second, args);
}
