#include "config/command_line.hpp"
#include <getopt.h>
#include <cerrno>
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace rpc_snoop {
namespace config {

using utils::ErrorCode;
using utils::Result;

namespace {

// 无短选项的长选项编码
enum LongOnlyOption {
    OPT_DROP_REQUEST_RATE = 256,
    OPT_DROP_RESPONSE_RATE,
    OPT_DROP_DELAY,
    OPT_SEED,
    OPT_LOG_LEVEL,
    OPT_LOG_FILE
};

const char* const kShortOptions = ":b:p:lns:S:fr:c:hV";

const struct option kLongOptions[] = {
    {"bind-address", required_argument, nullptr, 'b'},
    {"port", required_argument, nullptr, 'p'},
    {"log-headers", no_argument, nullptr, 'l'},
    {"no-color", no_argument, nullptr, 'n'},
    {"suppress-method", required_argument, nullptr, 's'},
    {"suppress-path", required_argument, nullptr, 'S'},
    {"drop-request-rate", required_argument, nullptr, OPT_DROP_REQUEST_RATE},
    {"drop-response-rate", required_argument, nullptr, OPT_DROP_RESPONSE_RATE},
    {"drop-delay", required_argument, nullptr, OPT_DROP_DELAY},
    {"seed", required_argument, nullptr, OPT_SEED},
    {"fix-geth-attach", no_argument, nullptr, 'f'},
    {"rpc-modules-override", required_argument, nullptr, 'r'},
    {"config", required_argument, nullptr, 'c'},
    {"log-level", required_argument, nullptr, OPT_LOG_LEVEL},
    {"log-file", required_argument, nullptr, OPT_LOG_FILE},
    {"help", no_argument, nullptr, 'h'},
    {"version", no_argument, nullptr, 'V'},
    {nullptr, 0, nullptr, 0}
};

const char* const kSuppressHelp =
    "LINES=n specifies the degree of suppression:\n"
    "    n < 0 Ignore message completely and log nothing [default]\n"
    "    n = 0 Log that message occurred, but don't print any JSON\n"
    "    n > 0 Log at most n lines of JSON\n"
    "TYPE is one of:\n"
    "    REQUEST:  Suppress request log\n"
    "    RESPONSE: Suppress response log\n"
    "    ALL:      Suppress both logs [default]\n";

Result<CommandLine::Action> usage_error(const std::string& message) {
    return utils::make_err<CommandLine::Action>(ErrorCode::INVALID_ARGUMENT, message);
}

bool parse_unsigned(const char* text, uint64_t max_value, uint64_t* out) {
    if (text == nullptr || *text == '\0') {
        return false;
    }
    for (const char* p = text; *p != '\0'; ++p) {
        if (*p < '0' || *p > '9') {
            return false;
        }
    }
    errno = 0;
    unsigned long long value = std::strtoull(text, nullptr, 10);
    if (errno == ERANGE || value > max_value) {
        return false;
    }
    *out = static_cast<uint64_t>(value);
    return true;
}

bool parse_seconds(const char* text, double* out) {
    if (text == nullptr || *text == '\0') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text, &end);
    if (errno == ERANGE || end == text || *end != '\0' || !(value >= 0.0)) {
        return false;
    }
    *out = value;
    return true;
}

// 出错选项的显示名
std::string option_name(int opt, char* argv[]) {
    if (opt > 0 && opt < 256) {
        return std::string("-") + static_cast<char>(opt);
    }
    if (optind > 0 && argv[optind - 1] != nullptr) {
        return argv[optind - 1];
    }
    return "option";
}

} // namespace

CommandLineOptions::CommandLineOptions()
    : has_bind_address(false)
    , has_port(false)
    , port(0)
    , log_headers(false)
    , no_color(false)
    , has_drop_request_rate(false)
    , drop_request_rate(0.0)
    , has_drop_response_rate(false)
    , drop_response_rate(0.0)
    , has_drop_delay(false)
    , drop_delay_seconds(0.0)
    , has_seed(false)
    , seed(0)
    , fix_geth_attach(false)
    , has_log_level(false)
    , has_log_file(false)
{
}

CommandLine::CommandLine() = default;

CommandLine::~CommandLine() = default;

Result<CommandLine::Action> CommandLine::parse(int argc, char* argv[]) {
    options_ = CommandLineOptions();
    Action action = Action::RUN;

    // optind=0 让glibc重新初始化，支持多次解析
    optind = 0;
    opterr = 0;

    int opt = 0;
    while ((opt = getopt_long(argc, argv, kShortOptions, kLongOptions, nullptr)) != -1) {
        uint64_t number = 0;
        switch (opt) {
            case 'b':
                options_.has_bind_address = true;
                options_.bind_address = optarg;
                break;
            case 'p':
                if (!parse_unsigned(optarg, 65535, &number) || number == 0) {
                    return usage_error(std::string("invalid port: ") + optarg);
                }
                options_.has_port = true;
                options_.port = static_cast<uint16_t>(number);
                break;
            case 'l':
                options_.log_headers = true;
                break;
            case 'n':
                options_.no_color = true;
                break;
            case 's':
            case 'S': {
                auto entry = parse_suppress_value(optarg);
                if (entry.is_err()) {
                    return usage_error(entry.error_message());
                }
                if (opt == 's') {
                    options_.suppress_methods.push_back(entry.take());
                } else {
                    options_.suppress_paths.push_back(entry.take());
                }
                break;
            }
            case OPT_DROP_REQUEST_RATE:
            case OPT_DROP_RESPONSE_RATE: {
                if (!parse_unsigned(optarg, 100, &number)) {
                    return usage_error(std::string(opt == OPT_DROP_REQUEST_RATE
                                                       ? "--drop-request-rate"
                                                       : "--drop-response-rate") +
                                       " must be an integer within [0..100], got " + optarg);
                }
                double prob = percent_to_probability(static_cast<int64_t>(number)).value();
                if (opt == OPT_DROP_REQUEST_RATE) {
                    options_.has_drop_request_rate = true;
                    options_.drop_request_rate = prob;
                } else {
                    options_.has_drop_response_rate = true;
                    options_.drop_response_rate = prob;
                }
                break;
            }
            case OPT_DROP_DELAY:
                if (!parse_seconds(optarg, &options_.drop_delay_seconds)) {
                    return usage_error(std::string("invalid --drop-delay: ") + optarg);
                }
                options_.has_drop_delay = true;
                break;
            case OPT_SEED:
                if (!parse_unsigned(optarg, UINT64_MAX, &options_.seed)) {
                    return usage_error(std::string("invalid --seed: ") + optarg);
                }
                options_.has_seed = true;
                break;
            case 'f':
                options_.fix_geth_attach = true;
                break;
            case 'r':
                // 每个模块在结果中只能出现一次
                if (std::find(options_.rpc_modules.begin(), options_.rpc_modules.end(),
                              optarg) != options_.rpc_modules.end()) {
                    return usage_error(std::string("duplicate rpc module: ") + optarg);
                }
                options_.rpc_modules.push_back(optarg);
                break;
            case 'c':
                options_.config_file = optarg;
                break;
            case OPT_LOG_LEVEL:
                options_.has_log_level = true;
                options_.log_level = optarg;
                break;
            case OPT_LOG_FILE:
                options_.has_log_file = true;
                options_.log_file = optarg;
                break;
            case 'h':
                action = Action::HELP;
                break;
            case 'V':
                if (action != Action::HELP) {
                    action = Action::VERSION;
                }
                break;
            case ':':
                return usage_error("missing value for " + option_name(optopt, argv));
            default:
                return usage_error("unknown option " + option_name(optopt, argv));
        }
    }

    if (action != Action::RUN) {
        return utils::make_ok(std::move(action));
    }

    if (!options_.rpc_modules.empty() && !options_.fix_geth_attach) {
        return usage_error("--rpc-modules-override requires --fix-geth-attach");
    }

    int positional = argc - optind;
    if (positional > 1) {
        return usage_error(std::string("unexpected argument: ") + argv[optind + 1]);
    }
    if (positional == 1) {
        options_.endpoint = argv[optind];
    } else if (options_.config_file.empty()) {
        return usage_error("missing required argument RPC_ENDPOINT");
    }

    return utils::make_ok(std::move(action));
}

const CommandLineOptions& CommandLine::options() const {
    return options_;
}

void CommandLine::apply(Config* config) const {
    if (!options_.endpoint.empty()) {
        config->set_endpoint(options_.endpoint);
    }

    ListenConfig listen = config->get_listen();
    if (options_.has_bind_address) {
        listen.ip = options_.bind_address;
    }
    if (options_.has_port) {
        listen.port = options_.port;
    }
    config->set_listen(listen);

    DisplayConfig display = config->get_display();
    if (options_.log_headers) {
        display.log_headers = true;
    }
    if (options_.no_color) {
        display.color = false;
    }
    config->set_display(display);

    // 同名规则以命令行为准，后出现的覆盖先出现的
    SuppressConfig suppress = config->get_suppress();
    for (const auto& entry : options_.suppress_methods) {
        suppress.methods[entry.key] = entry.rule;
    }
    for (const auto& entry : options_.suppress_paths) {
        suppress.paths[entry.key] = entry.rule;
    }
    config->set_suppress(suppress);

    ChaosConfig chaos = config->get_chaos();
    if (options_.has_drop_request_rate) {
        chaos.drop_request_rate = options_.drop_request_rate;
    }
    if (options_.has_drop_response_rate) {
        chaos.drop_response_rate = options_.drop_response_rate;
    }
    if (options_.has_drop_delay) {
        chaos.drop_delay_seconds = options_.drop_delay_seconds;
    }
    if (options_.has_seed) {
        chaos.has_seed = true;
        chaos.seed = options_.seed;
    }
    config->set_chaos(chaos);

    if (options_.fix_geth_attach) {
        RpcModulesOverrideConfig override_config = config->get_rpc_modules_override();
        override_config.enabled = true;
        if (!options_.rpc_modules.empty()) {
            override_config.modules = options_.rpc_modules;
        } else if (override_config.modules.empty()) {
            override_config.modules = default_rpc_modules();
        }
        config->set_rpc_modules_override(override_config);
    }

    LoggingConfig logging = config->get_logging();
    if (options_.has_log_level) {
        logging.level = options_.log_level;
    }
    if (options_.has_log_file) {
        logging.file = options_.log_file;
    }
    config->set_logging(logging);
}

std::string CommandLine::usage(const std::string& program) {
    std::ostringstream out;
    out << "JSON-RPC Snooping Tool " << version() << "\n"
        << "Proxies an http JSON-RPC endpoint and dumps requests and responses to screen\n"
        << "\n"
        << "USAGE:\n"
        << "    " << program << " [OPTIONS] <RPC_ENDPOINT>\n"
        << "\n"
        << "ARGS:\n"
        << "    <RPC_ENDPOINT>    JSON-RPC endpoint to forward incoming requests\n"
        << "\n"
        << "OPTIONS:\n"
        << "    -b, --bind-address <ADDR>          Address to bind to and listen for incoming"
           " requests [default: 127.0.0.1]\n"
        << "    -p, --port <PORT>                  Port to listen for incoming requests"
           " [default: 3000]\n"
        << "    -l, --log-headers                  Print the headers in addition to"
           " request/response\n"
        << "    -n, --no-color                     Do not use terminal colors in output\n"
        << "    -s, --suppress-method <METHOD[:LINES][:TYPE]>\n"
        << "                                       Suppress output of JSON RPC calls of this"
           " METHOD (can specify more than once)\n"
        << "    -S, --suppress-path <PATH[:LINES][:TYPE]>\n"
        << "                                       Suppress output of requests to the endpoint"
           " with this PATH (can specify more than once)\n"
        << "        --drop-request-rate <0..100>   odds of randomly dropping a request for chaos"
           " testing [default: 0]\n"
        << "        --drop-response-rate <0..100>  odds of randomly dropping a response for chaos"
           " testing [default: 0]\n"
        << "        --drop-delay <SECONDS>         delay before a dropped exchange is abandoned"
           " [default: 12]\n"
        << "        --seed <N>                     seed for the drop decision generator\n"
        << "    -f, --fix-geth-attach              Override the results of the `rpc_modules`"
           " method\n"
        << "    -r, --rpc-modules-override <MODULE>\n"
        << "                                       Specify a module to return from the"
           " `rpc_modules` method (can specify more than once, requires -f)."
           " Default [eth,net,web3]\n"
        << "    -c, --config <FILE>                JSON config file; command line options take"
           " precedence\n"
        << "        --log-level <LEVEL>            DEBUG, INFO, WARN or ERROR [default: WARN]\n"
        << "        --log-file <FILE>              Append diagnostic log to FILE\n"
        << "    -h, --help                         Print help information\n"
        << "    -V, --version                      Print version information\n"
        << "\n"
        << kSuppressHelp;
    return out.str();
}

const char* CommandLine::version() {
    return "0.2";
}

} // namespace config
} // namespace rpc_snoop
