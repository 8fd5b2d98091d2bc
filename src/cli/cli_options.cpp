// ---------------------------------------------------------------------------
// cli_options.cpp
// ---------------------------------------------------------------------------

#include "cli/cli_options.hpp"

#include <format>
#include <limits>
#include <sstream>
#include <string_view>

#include <boost/program_options.hpp>

#include "config/config_loader.hpp"

namespace po = boost::program_options;

namespace {

// 사용자에게 보이는 옵션 (usage_text 에 출력됨)
po::options_description visible_options() {
    po::options_description desc("Options");
    desc.add_options()
        ("rows,r",      po::value<std::int64_t>(),             "row-count hint for lock estimates (default 0)")
        ("format,f",    po::value<std::string>(),              "report format: text|json|sarif")
        ("fail-on",     po::value<std::string>(),              "exit 1 at or above: low|medium|high|critical (default high)")
        ("disable",     po::value<std::vector<std::string>>()->composing(),
                                                               "skip rule IDs (comma separated, repeatable)")
        ("jobs,j",      po::value<std::int64_t>(),             "worker threads (default: hardware concurrency)")
        ("config,c",    po::value<std::string>(),              "YAML config file (default .migsafe.yaml)")
        ("log-level",   po::value<std::string>(),              "trace|debug|info|warn|error|critical|off")
        ("log-file",    po::value<std::string>(),              "write JSON-lines event log to this file")
        ("list-rules",  po::bool_switch(),                     "print the rule catalog and exit")
        ("help,h",      po::bool_switch(),                     "show this help")
        ("version",     po::bool_switch(),                     "show version");
    return desc;
}

// "A,B, C" → {"A","B","C"} (빈 토큰 무시)
void split_ids(std::string_view text, std::vector<std::string>& out) {
    while (!text.empty()) {
        const auto comma = text.find(',');
        auto token = text.substr(0, comma);
        while (!token.empty() && token.front() == ' ') token.remove_prefix(1);
        while (!token.empty() && token.back() == ' ')  token.remove_suffix(1);
        if (!token.empty()) {
            out.emplace_back(token);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
}

}  // namespace

std::expected<CliOptions, std::string>
parse_cli(int argc, const char* const argv[]) {
    po::options_description hidden("Hidden");
    hidden.add_options()
        ("paths", po::value<std::vector<std::string>>(), "input paths");

    po::options_description all;
    all.add(visible_options()).add(hidden);

    po::positional_options_description positional;
    positional.add("paths", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        return std::unexpected(std::string(e.what()));
    }

    CliOptions opts;
    opts.show_help    = vm["help"].as<bool>();
    opts.show_version = vm["version"].as<bool>();
    opts.list_rules   = vm["list-rules"].as<bool>();

    if (vm.count("paths") != 0) {
        opts.paths = vm["paths"].as<std::vector<std::string>>();
    }

    if (vm.count("rows") != 0) {
        const auto rows = vm["rows"].as<std::int64_t>();
        if (rows < 0) {
            return std::unexpected(std::format("--rows must be >= 0 (got {})", rows));
        }
        opts.rows = rows;
    }

    if (vm.count("format") != 0) {
        const auto& name = vm["format"].as<std::string>();
        opts.format = parse_output_format(name);
        if (!opts.format) {
            return std::unexpected(std::format("invalid --format '{}' (text|json|sarif)", name));
        }
    }

    if (vm.count("fail-on") != 0) {
        const auto& name = vm["fail-on"].as<std::string>();
        opts.fail_on = parse_severity(name);
        if (!opts.fail_on) {
            return std::unexpected(
                std::format("invalid --fail-on '{}' (low|medium|high|critical)", name));
        }
    }

    if (vm.count("jobs") != 0) {
        const auto jobs = vm["jobs"].as<std::int64_t>();
        if (jobs < 0 || jobs > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
            return std::unexpected(std::format("--jobs out of range (got {})", jobs));
        }
        opts.jobs = static_cast<std::uint32_t>(jobs);
    }

    if (vm.count("log-level") != 0) {
        const auto& level = vm["log-level"].as<std::string>();
        if (!ConfigLoader::is_valid_log_level(level)) {
            return std::unexpected(std::format("invalid --log-level '{}'", level));
        }
        opts.log_level = level;
    }

    if (vm.count("log-file") != 0) {
        opts.log_file = vm["log-file"].as<std::string>();
    }
    if (vm.count("config") != 0) {
        opts.config_path = vm["config"].as<std::string>();
    }

    if (vm.count("disable") != 0) {
        for (const auto& value : vm["disable"].as<std::vector<std::string>>()) {
            split_ids(value, opts.disabled_rules);
        }
    }

    if (opts.paths.empty() && !opts.show_help && !opts.show_version && !opts.list_rules) {
        return std::unexpected(std::string("no input paths"));
    }
    return opts;
}

void apply_cli(const CliOptions& opts, LintConfig& cfg) {
    if (opts.rows)      cfg.rows      = *opts.rows;
    if (opts.format)    cfg.format    = *opts.format;
    if (opts.fail_on)   cfg.fail_on   = *opts.fail_on;
    if (opts.jobs)      cfg.jobs      = *opts.jobs;
    if (opts.log_level) cfg.log_level = *opts.log_level;
    if (opts.log_file)  cfg.log_path  = *opts.log_file;

    cfg.disabled_rules.insert(cfg.disabled_rules.end(),
                              opts.disabled_rules.begin(), opts.disabled_rules.end());
}

std::string usage_text() {
    std::ostringstream out;
    out << "Usage: migsafe [options] <path>...\n\n"
        << "Lint SQL migration files for statements that take long-held locks.\n"
        << "A directory argument is scanned recursively for *.sql files.\n\n"
        << visible_options();
    return out.str();
}
