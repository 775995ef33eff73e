/**
 * @file sample_app.cpp
 */
#include "stagedag/tool/sample_app.hpp"
#include "stagedag/keys/descriptor.inline.hpp"
#include "stagedag/keys/key.inline.hpp"
#include "stagedag/keys/value_expr.hpp"

namespace stagedag
{

SampleApp::SampleApp()
    : log_level(registry.create<std::string>(
          "log_level", "Minimum level of logged messages.", Stage::Both, "info", desc::string()))
    , port(registry.create<int>(
          "port", "TCP port the HTTP server listens on.", Stage::Configure, 8080,
          desc::integer()))
    , hosts(registry.create<std::vector<std::string>>(
          "hosts", "Host names the HTTP server answers to.", Stage::Run,
          std::vector<std::string>{"localhost"}, desc::list(desc::string())))
{
    Value<std::string> listen_address = map(
        [](const int& p) { return "0.0.0.0:" + std::to_string(p); }, value(port));

    console = graph.add_vertex("console_sink{}");
    logger = graph.add_configurable(
        ConfigurableInfo{"logger", "make_logger", KeySet{log_level}, {}}, {console});
    http = graph.add_configurable(
        ConfigurableInfo{"http", "make_http_server", KeySet{port, hosts}, {listen_address}}, {});
    app = graph.add_app(http, {logger});
}

} // namespace stagedag
