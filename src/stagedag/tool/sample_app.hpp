/**
 * @file sample_app.hpp
 * @brief The application graph built by stagedag_tool.
 */
#pragma once
#include "stagedag/common/common.hpp"
#include "stagedag/graph/graph.hpp"
#include "stagedag/keys/key.hpp"

namespace stagedag
{

/**
 * @brief A small application: a console sink feeding a logger, and an HTTP
 * server applied to that logger.
 *
 * @details
 * | Node    | Kind         | Keys                |
 * |---------|--------------|---------------------|
 * | console | vertex       |                     |
 * | logger  | configurable | log_level           |
 * | http    | configurable | port, hosts         |
 * | app     | app          | (http applied to logger) |
 */
struct SampleApp
{
    SampleApp();

    KeyRegistry registry;

    Key<std::string> log_level;
    Key<int> port;
    Key<std::vector<std::string>> hosts;

    Graph graph;

    NodeIdx console;
    NodeIdx logger;
    NodeIdx http;
    NodeIdx app;
};

} // namespace stagedag
