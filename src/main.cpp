#include "issueforest/graph/forest_builder.hpp"
#include "issueforest/io/snapshot_reader.hpp"
#include "issueforest/runtime/config.hpp"
#include "issueforest/runtime/logging.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

using namespace issueforest;

namespace
{

void print_usage()
{
    std::cerr << "Usage: issueforest [--config <config.yaml>] [--outline] [<snapshot.jsonl>]\n";
}

void print_stats(const ForestStats& s)
{
    std::cout << s.total << " issues: " << s.in_progress << " in progress, " << s.ready
              << " ready, " << s.blocked << " blocked, " << s.closed << " closed\n";
}

/// One line per display row; a node with k parents is printed k times.
void print_outline(const IssueForest& forest, bool show_closed)
{
    struct Row
    {
        NodeIdx idx;
        int indent;
    };
    std::vector<Row> pending;
    const auto& roots = forest.roots();
    for (auto it = roots.rbegin(); it != roots.rend(); ++it)
    {
        pending.push_back(Row{*it, 0});
    }

    while (!pending.empty())
    {
        Row row = pending.back();
        pending.pop_back();
        const Node& node = forest.node(row.idx);
        if (!show_closed && node.status == IssueStatus::Closed)
        {
            continue;
        }

        std::cout << std::string(static_cast<size_t>(row.indent) * 2, ' ')
                  << (node.children.empty() ? "- " : "+ ")
                  << node.id() << " [" << to_string(node.status) << "]";
        if (node.is_blocked)
        {
            std::cout << " (blocked)";
        }
        std::cout << " " << node.issue.title << "\n";

        for (auto it = node.children.rbegin(); it != node.children.rend(); ++it)
        {
            pending.push_back(Row{*it, row.indent + 1});
        }
    }
}

} // namespace

int main(int argc, char** argv)
{
    std::string config_path;
    std::string snapshot_path;
    bool force_outline = false;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg == "--outline")
        {
            force_outline = true;
        }
        else if (arg == "-h" || arg == "--help")
        {
            print_usage();
            return EXIT_SUCCESS;
        }
        else if (!arg.empty() && arg[0] != '-' && snapshot_path.empty())
        {
            snapshot_path = arg;
        }
        else
        {
            print_usage();
            return 1;
        }
    }

    try
    {
        RuntimeConfig config = config_path.empty() ? RuntimeConfig{}
                                                   : ConfigLoader::load_from_yaml(config_path);
        ConfigLoader::apply_environment(config);
        if (!snapshot_path.empty())
        {
            config.input.path = snapshot_path;
        }
        if (force_outline)
        {
            config.output.format = OutputFormat::Outline;
        }
        logging::initialize_logging(config);

        if (config.input.path.empty())
        {
            print_usage();
            logging::shutdown_logging();
            return 1;
        }

        auto issues = SnapshotReader::read_file(config.input.path);
        IssueForest forest = ForestBuilder().build(issues);
        for (const auto& warning : forest.diagnostics().warnings())
        {
            ISSUEFOREST_LOG_DEBUG(warning.message,
                {logging::string_field("category", to_string(warning.category))});
        }

        const bool outline = config.output.format == OutputFormat::Outline;
        ISSUEFOREST_LOG_INFO("forest ready",
            {logging::string_field("input", config.input.path),
             logging::int_field("nodes", static_cast<int64_t>(forest.node_count())),
             logging::int_field("warnings", static_cast<int64_t>(forest.diagnostics().warnings().size())),
             logging::bool_field("outline", outline),
             logging::bool_field("show_closed", config.output.show_closed)});

        print_stats(forest.stats());
        if (outline)
        {
            print_outline(forest, config.output.show_closed);
        }
        logging::shutdown_logging();
    }
    catch (const CyclicDependencyError& e)
    {
        std::cerr << "Error:\n" << e.what() << "\n" << std::flush;
        logging::shutdown_logging();
        return 2;
    }
    catch (const std::exception& e)
    {
        ISSUEFOREST_LOG_ERROR("fatal error", {logging::string_field("error", e.what())});
        std::cerr << "Error:\n" << e.what() << "\n" << std::flush;
        logging::shutdown_logging();
        return 2;
    }
    return EXIT_SUCCESS;
}
