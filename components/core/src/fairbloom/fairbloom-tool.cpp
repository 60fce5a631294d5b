#include <cmath>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "filter/Aggregate.hpp"
#include "filter/AutoGrowingAggregate.hpp"
#include "filter/Filter.hpp"
#include "filter/FilterComponent.hpp"
#include "filter/FilterFile.hpp"
#include "FilterConfig.hpp"
#include "TraceableException.hpp"

using fairbloom::AggregateOptions;
using fairbloom::AutoGrowingAggregate;
using fairbloom::Filter;
using fairbloom::FilterComponent;
using fairbloom::FilterConfig;

namespace {
namespace po = boost::program_options;

constexpr int cDemoCapacity = 1000;

struct CreateOptions {
    std::string output_path;
    size_t size{0};
    bool auto_grow{false};
};

/**
 * Adds the options describing how new filters are sized. They're accepted by every command that
 * may have to grow an auto-growing aggregate.
 */
void add_filter_config_options(po::options_description& options, FilterConfig& config) {
    // clang-format off
    options.add_options()
            ("probability,p",
             po::value<double>(&config.false_positive_rate)
                     ->value_name("P")
                     ->default_value(config.false_positive_rate),
             "Target false positive probability of new filters")
            ("capacity,n",
             po::value<int64_t>(&config.capacity)
                     ->value_name("N")
                     ->default_value(config.capacity),
             "Number of items new filters are sized for")
            ("threshold",
             po::value<double>(&config.false_probability_threshold)
                     ->value_name("T")
                     ->default_value(config.false_probability_threshold),
             "False positive probability above which aggregate members stop receiving items");
    // clang-format on
}

void parse_hash_algorithms(std::string const& hashes_csv, FilterConfig& config) {
    if (hashes_csv.empty()) {
        return;
    }
    auto algorithms = fairbloom::parse_hash_algorithm_list(hashes_csv);
    if (false == algorithms.has_value()) {
        throw std::invalid_argument("hashes must be a comma-separated list of known algorithms.");
    }
    config.hash_algorithms = std::move(algorithms.value());
}

auto parse_subcommand(
        int argc,
        char const* argv[],
        po::options_description const& options,
        po::positional_options_description const& positional
) -> po::variables_map {
    int sub_argc = argc - 1;
    char const** sub_argv = argv + 1;
    po::variables_map vm;
    po::store(
            po::command_line_parser(sub_argc, sub_argv)
                    .options(options)
                    .positional(positional)
                    .run(),
            vm
    );
    po::notify(vm);
    return vm;
}

auto component_type(FilterComponent const& component) -> std::string {
    if (nullptr != component.get_if_filter()) {
        return "filter";
    }
    if (nullptr != component.get_if_aggregate()) {
        return "aggregate";
    }
    return "auto_growing";
}

auto get_stats(FilterComponent const& component, double probability) -> nlohmann::json {
    nlohmann::json stats;
    stats["type"] = component_type(component);
    stats["count"] = component.count();
    stats["false_positive_probability"] = component.get_false_positive_probability();
    stats["full"] = component.is_full();

    if (auto const* filter = component.get_if_filter(); nullptr != filter) {
        std::vector<std::string> hash_names;
        for (auto const algorithm : filter->get_hashes()) {
            hash_names.emplace_back(fairbloom::hash_algorithm_to_string(algorithm));
        }
        stats["size"] = filter->get_size();
        stats["hash_algorithms"] = hash_names;
        auto const capacity = filter->estimate_capacity(probability);
        if (std::isinf(capacity)) {
            stats["capacity"] = nullptr;
        } else {
            stats["capacity"] = capacity;
        }
        stats["fill_rate"] = filter->estimate_fill_rate(probability);
        return stats;
    }

    auto const* aggregate = component.get_if_aggregate();
    if (nullptr == aggregate) {
        aggregate = &component.get_if_auto_growing()->get_aggregate();
    }
    stats["false_probability_threshold"] = aggregate->get_options().false_probability_threshold;
    stats["weights"] = aggregate->get_weights();
    auto children = nlohmann::json::array();
    for (auto const& child : aggregate->get_children()) {
        children.push_back(get_stats(child, probability));
    }
    stats["children"] = std::move(children);
    return stats;
}

auto run_demo() -> int {
    fmt::print("   p (hashes) :  size -   cap -  fill : error\n");
    for (int percent = 1; percent < 100; ++percent) {
        auto const probability = percent / 100.0;
        auto filter = Filter::get_optimum_filter(probability, cDemoCapacity);
        auto const capacity = filter.estimate_capacity(probability);

        size_t num_items{0};
        while (filter.get_false_positive_probability() < probability) {
            filter.add(std::to_string(num_items));
            ++num_items;
        }

        auto const error = (capacity - static_cast<double>(num_items))
                           / static_cast<double>(num_items) * 100.0;
        fmt::print(
                "{:>3}% ({:>4}) : {:>5} - {:>5.0f} - {:>5} : {:>4.0f}%\n",
                percent,
                filter.get_hashes().size(),
                filter.get_size(),
                capacity,
                num_items,
                error
        );
    }
    return 0;
}

auto run_create(CreateOptions const& options, FilterConfig const& config) -> int {
    fairbloom::validate_filter_config(config);

    if (options.auto_grow) {
        AutoGrowingAggregate aggregate{
                fairbloom::make_optimum_filter_factory(config),
                AggregateOptions{config.false_probability_threshold}
        };
        fairbloom::filter::write_filter_file(options.output_path, aggregate);
    } else if (0 != options.size) {
        if (config.hash_algorithms.empty()) {
            throw std::invalid_argument("hashes must be specified along with size.");
        }
        fairbloom::filter::write_filter_file(
                options.output_path,
                Filter{options.size, config.hash_algorithms}
        );
    } else if (config.hash_algorithms.empty()) {
        fairbloom::filter::write_filter_file(
                options.output_path,
                Filter::get_optimum_filter(config.false_positive_rate, config.capacity)
        );
    } else {
        auto const size = Filter::get_optimal_size(config.false_positive_rate, config.capacity);
        fairbloom::filter::write_filter_file(
                options.output_path,
                Filter{Filter::to_filter_size(size), config.hash_algorithms}
        );
    }

    SPDLOG_INFO("Created filter {}", options.output_path);
    return 0;
}

auto run_add(
        std::string const& path,
        std::vector<std::string> const& items,
        FilterConfig const& config
) -> int {
    auto component = fairbloom::filter::read_filter_file(
            path,
            fairbloom::make_optimum_filter_factory(config)
    );
    for (auto const& item : items) {
        component.add(item);
    }
    fairbloom::filter::write_filter_file(path, component);

    SPDLOG_INFO("Added {} items to filter {} (count={})", items.size(), path, component.count());
    return 0;
}

auto run_query(
        std::string const& path,
        std::vector<std::string> const& items,
        FilterConfig const& config
) -> int {
    auto const component = fairbloom::filter::read_filter_file(
            path,
            fairbloom::make_optimum_filter_factory(config)
    );
    for (auto const& item : items) {
        std::cout << item << '\t' << (component.has(item) ? "maybe" : "no") << '\n';
    }
    std::cout.flush();
    return 0;
}

auto run_stats(std::string const& path, FilterConfig const& config) -> int {
    auto const component = fairbloom::filter::read_filter_file(
            path,
            fairbloom::make_optimum_filter_factory(config)
    );
    std::cout << get_stats(component, config.false_positive_rate).dump(2) << std::endl;
    return 0;
}
}  // namespace

int main(int argc, char const* argv[]) {
    try {
        auto stderr_logger = spdlog::stderr_logger_st("stderr");
        spdlog::set_default_logger(stderr_logger);
        spdlog::set_pattern("%Y-%m-%dT%H:%M:%S.%e%z [%l] %v");
    } catch (std::exception const&) {
        return 1;
    }

    try {
        auto print_usage = []() {
            std::cerr << "Usage: fairbloom <command> [options]\n"
                         "Commands:\n"
                         "  demo   Compare estimated and actual capacities of optimum filters\n"
                         "  create Create an empty filter file\n"
                         "  add    Add items to a filter file\n"
                         "  query  Test items against a filter file\n"
                         "  stats  Print statistics of a filter file\n"
                      << std::endl;
        };

        if (argc < 2) {
            print_usage();
            return 1;
        }

        std::string command = argv[1];
        if (command == "--help" || command == "-h") {
            print_usage();
            return 0;
        }

        if (command == "demo") {
            return run_demo();
        }

        FilterConfig config;
        std::string hashes_csv;

        if (command == "create") {
            CreateOptions create_options;

            po::options_description options("Create options");
            // clang-format off
            options.add_options()
                    ("help,h", "Show help")
                    ("output,o",
                     po::value<std::string>(&create_options.output_path)->value_name("PATH"),
                     "Output filter file")
                    ("size,m", po::value<size_t>(&create_options.size)->value_name("BITS"),
                     "Size in bits (requires --hashes)")
                    ("hashes", po::value<std::string>(&hashes_csv)->value_name("ALGOS"),
                     "Comma-separated hash algorithms")
                    ("auto-grow", po::bool_switch(&create_options.auto_grow),
                     "Create an aggregate that adds filters as it fills up");
            // clang-format on
            add_filter_config_options(options, config);

            po::positional_options_description positional;
            positional.add("output", 1);
            auto const vm = parse_subcommand(argc, argv, options, positional);

            if (vm.count("help")) {
                std::cerr << "Usage: fairbloom create --output <PATH> [--probability <P> "
                             "--capacity <N> | --size <BITS> --hashes <ALGOS>] [--auto-grow]"
                          << std::endl
                          << std::endl;
                std::cerr << options << std::endl;
                return 0;
            }

            if (create_options.output_path.empty()) {
                throw std::invalid_argument("output must be specified.");
            }
            parse_hash_algorithms(hashes_csv, config);
            return run_create(create_options, config);
        }

        if (command == "add" || command == "query" || command == "stats") {
            std::string path;
            std::vector<std::string> items;

            po::options_description options("Filter file options");
            // clang-format off
            options.add_options()
                    ("help,h", "Show help")
                    ("file,f", po::value<std::string>(&path)->value_name("PATH"),
                     "Filter file")
                    ("hashes", po::value<std::string>(&hashes_csv)->value_name("ALGOS"),
                     "Comma-separated hash algorithms of filters added by auto-growth");
            // clang-format on
            add_filter_config_options(options, config);
            if (command != "stats") {
                options.add_options()(
                        "item",
                        po::value<std::vector<std::string>>(&items)->value_name("ITEM"),
                        "Items"
                );
            }

            po::positional_options_description positional;
            if (command != "stats") {
                positional.add("item", -1);
            }
            auto const vm = parse_subcommand(argc, argv, options, positional);

            if (vm.count("help")) {
                std::cerr << "Usage: fairbloom " << command << " --file <PATH>"
                          << (command == "stats" ? "" : " <ITEM>...") << std::endl
                          << std::endl;
                std::cerr << options << std::endl;
                return 0;
            }

            if (path.empty()) {
                throw std::invalid_argument("file must be specified.");
            }
            parse_hash_algorithms(hashes_csv, config);

            if (command == "stats") {
                return run_stats(path, config);
            }
            if (items.empty()) {
                throw std::invalid_argument("No item specified.");
            }
            if (command == "add") {
                return run_add(path, items, config);
            }
            return run_query(path, items, config);
        }

        print_usage();
        return 1;
    } catch (fairbloom::TraceableException const& e) {
        SPDLOG_ERROR(
                "{}:{} {} (error code {})",
                e.get_filename(),
                e.get_line_number(),
                e.what(),
                static_cast<int>(e.get_error_code())
        );
        return 1;
    } catch (std::exception const& e) {
        SPDLOG_ERROR("{}", e.what());
        std::cerr << "Try --help for usage." << std::endl;
        return 1;
    }
}
