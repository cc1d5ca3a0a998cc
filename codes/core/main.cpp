// =============================================================================
//  JSON-RPC Snoop - Main
//  文件: main.cpp
//  描述: 程序入口：解析命令行与配置，启动代理服务
//  版权: Copyright (c) 2026
// =============================================================================
#include "config/command_line.hpp"
#include "config/config.hpp"
#include "protocol/http_client.hpp"
#include "protocol/tls_stream.hpp"
#include "proxy/exchange_handler.hpp"
#include "proxy/exchange_statistics.hpp"
#include "proxy/presenter.hpp"
#include "proxy/proxy_context.hpp"
#include "server/server.hpp"
#include "utils/logger.hpp"
#include <chrono>
#include <csignal>
#include <signal.h>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

using namespace rpc_snoop;

namespace {

constexpr int EXIT_USAGE = 2;

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) {
    g_stop_requested = 1;
}

void install_signal_handlers() {
    struct sigaction action;
    action.sa_handler = handle_stop_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    // 对端提前关闭时写socket不应终止进程
    std::signal(SIGPIPE, SIG_IGN);
}

int usage_error(const std::string& program, const std::string& message) {
    std::fprintf(stderr, "error: %s\n\n%s", message.c_str(),
                 config::CommandLine::usage(program).c_str());
    return EXIT_USAGE;
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string program = (argc > 0 && argv[0]) ? argv[0] : "rpc_snoop";

    // ========== 命令行 ==========
    config::CommandLine command_line;
    auto action = command_line.parse(argc, argv);
    if (action.is_err()) {
        return usage_error(program, action.error_message());
    }
    if (action.value() == config::CommandLine::Action::HELP) {
        std::fputs(config::CommandLine::usage(program).c_str(), stdout);
        return 0;
    }
    if (action.value() == config::CommandLine::Action::VERSION) {
        std::printf("json_rpc_snoop %s\n", config::CommandLine::version());
        return 0;
    }

    // ========== 配置 ==========
    config::Config cfg;
    const std::string& config_file = command_line.options().config_file;
    if (!config_file.empty()) {
        auto loaded = cfg.load_from_file(config_file);
        if (loaded.is_err()) {
            std::fprintf(stderr, "error: failed to load config file %s: %s\n",
                         config_file.c_str(), loaded.error_message().c_str());
            return EXIT_FAILURE;
        }
    }
    command_line.apply(&cfg);

    auto valid = cfg.validate();
    if (valid.is_err()) {
        return usage_error(program, valid.error_message());
    }

    // ========== 日志 ==========
    utils::LogLevel level = utils::LogLevel::WARN;
    if (!utils::parse_log_level(cfg.get_logging().level, &level)) {
        level = utils::LogLevel::WARN;
    }
    if (utils::Logger::instance().init(level, cfg.get_logging().file) != 0) {
        std::fprintf(stderr, "error: failed to open log file %s\n",
                     cfg.get_logging().file.c_str());
        return EXIT_FAILURE;
    }

    install_signal_handlers();

    // ========== 代理组件 ==========
    auto context = proxy::ProxyContext::create(cfg);
    if (context.is_err()) {
        std::fprintf(stderr, "error: %s\n", context.error_message().c_str());
        return EXIT_FAILURE;
    }
    std::shared_ptr<proxy::ProxyContext> proxy_context = context.take();

    std::shared_ptr<protocol::TlsClientContext> tls_context;
    auto tls = protocol::TlsClientContext::create(true);
    if (tls.is_ok()) {
        tls_context = tls.take();
    } else if (proxy_context->destination().is_tls()) {
        std::fprintf(stderr, "error: %s\n", tls.error_message().c_str());
        return EXIT_FAILURE;
    } else {
        LOG_WARN("Main", "TLS unavailable: %s", tls.error_message().c_str());
    }

    protocol::HttpClient client(tls_context);
    proxy::Presenter presenter(cfg.get_display(), &std::cout);
    proxy::ExchangeStatistics statistics;
    proxy::ExchangeHandler handler(proxy_context.get(), &client, &presenter, &statistics);

    // ========== 服务 ==========
    server::Server srv(&handler);
    int ret = srv.init(cfg.get_listen());
    if (ret != server::ERR_SUCCESS) {
        std::fprintf(stderr, "error: cannot listen on %s:%u: %s\n",
                     cfg.get_listen().ip.c_str(), static_cast<unsigned>(cfg.get_listen().port),
                     server::server_error_to_string(ret));
        return EXIT_FAILURE;
    }
    ret = srv.start();
    if (ret != server::ERR_SUCCESS) {
        std::fprintf(stderr, "error: failed to start server: %s\n",
                     server::server_error_to_string(ret));
        return EXIT_FAILURE;
    }

    LOG_INFO("Main", "json_rpc_snoop %s forwarding %s:%u -> %s", config::CommandLine::version(),
             cfg.get_listen().ip.c_str(), static_cast<unsigned>(srv.listen_port()),
             proxy_context->destination_base().c_str());

    while (!g_stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LOG_INFO("Main", "Shutdown requested");
    if (srv.stop() != server::ERR_SUCCESS) {
        LOG_WARN("Main", "Server was not running at shutdown");
    }
    statistics.log_summary();
    utils::Logger::instance().flush();

    // stop()已结束丢包延迟；仍在等待上游响应的会话线程随进程退出，不在析构中等待
    std::fflush(stdout);
    std::_Exit(0);
}

// 文件结束
