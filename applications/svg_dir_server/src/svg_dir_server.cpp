#include "http/http_server.hpp"
#include "network/io_context_pool.hpp"
#include "network/services/svg_dir/svg_dir_cli.hpp"
#include "network/services/svg_dir/svg_request_handler.hpp"

#include <iostream>
#include <system_error>

#include "svgserve/basic/arg_parser.hpp"
#include "svgserve/basic/log.h"

using namespace network;

int main(int argc, char* argv[]) {
    SvgServe::arg_parser arg_parser { argc, argv, svg_dir::kSvgDirServerVersion };
    svg_dir::add_svg_dir_options(arg_parser);
    if (!arg_parser.ParseCommandLine()) {
        arg_parser.ShowHelp(std::cerr);
        return 1;
    }
    if (arg_parser.HasParam()) {
        arg_parser.ShowHelp();
        return 0;
    }
    if (arg_parser.HasParam(arg_parser.kVersionOptionName)) {
        arg_parser.ShowVersion();
        return 0;
    }

    std::cout << svg_dir::kSvgDirUsageGuide << std::endl << std::endl;

    try {
        SvgServe::Logger::LoggerInitOptions options;
        if (arg_parser.HasParam(svg_dir::kVerboseOptionName)) options.minimumLevel = SvgServe::LogLevel::debug;
        auto log_dir = arg_parser.GetOptionValue(svg_dir::kLogDirOptionName);
        if (log_dir.has_value()) options.logOutputPath = log_dir.value();
        options.logOutputProgramName = "svg_dir_server";
        SvgServe::Logger::Initialize(std::move(options));

        const auto config = svg_dir::make_svg_dir_config(svg_dir::read_svg_dir_options(arg_parser));
        SINFO("serving {} on {}:{} index:{} threads:{} timeout:{}ms", config.root_dir.string(), config.bind_address,
              config.port, config.index_route, config.threads, config.timeout_msec);

        io_context_pool pool(config.threads);
        pool.enable_signal_stop();
        auto server = http::http_server::make_shared(svg_dir::to_http_server_config(config), pool);
        server->set_handler(svg_dir::svg_request_handler(config));
        server->start();
        pool.run();
        server->stop();
        SINFO("svg_dir_server exit");
    } catch (const std::invalid_argument& e) {
        SERR("invalid config:{}", e.what());
        return 1;
    } catch (const std::system_error& e) {
        SERR("start server failed:{}", e.what());
        return 1;
    } catch (const std::runtime_error& e) {
        SERR("startup failed:{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        SERR("svg_dir_server failed:{}", e.what());
        return 1;
    }
    SvgServe::Logger::Release();
    return 0;
}
