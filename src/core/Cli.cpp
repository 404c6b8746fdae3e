#include "Cli.h"
#include "ArgumentParser.h"
#include "ConfigValidator.h"
#include "Errors.h"
#include "JSONWriter.h"
#include "Logging.h"
#include "Reporter.h"
#include "Runner.h"
#include <fstream>
#include <stdexcept>

namespace pattern_harness {

namespace {
    // Honours --enable/--disable/--category the same way run --all does.
    void list_examples(const ExampleRegistry& registry, const Config& cfg, std::ostream& out) {
        Runner selector(registry, cfg);
        const bool verbose = cfg.verbose;
        for(const auto& spec : registry.all()) {
            if(!selector.is_selected(spec)) continue;
            out << spec.name << '\t' << category_name(spec.category);
            if(verbose) {
                try {
                    ExamplePtr ex = spec.factory();
                    out << '\t' << (ex ? ex->describe().intent : std::string("<no instance>"));
                } catch(const std::exception& e) {
                    out << '\t' << "<unavailable: " << e.what() << ">";
                }
            }
            out << '\n';
        }
    }

    void warn_unknown(const ExampleRegistry& registry, const std::vector<std::string>& names, const char* flag) {
        for(const auto& n : names) {
            if(!registry.contains(n)) Logger::instance().warn(std::string(flag) + " names unknown example: " + n);
        }
    }

    std::string render(const std::vector<RunResult>& results, const Config& cfg) {
        if(cfg.format == "json") return JSONWriter().write(results, cfg);
        if(cfg.format == "ndjson") return JSONWriter().write_ndjson(results, cfg);
        return TextReporter(cfg.verbose).render(results);
    }
}

int run_cli(int argc, char** argv, std::ostream& out, std::ostream& err) {
    return run_cli(argc, argv, out, err, [](ExampleRegistry& registry, const Config& cfg){ registry.register_all_default(cfg); });
}

int run_cli(int argc, char** argv, std::ostream& out, std::ostream& err, const RegistryBuilder& build) {
    Config cfg;
    ArgumentParser parser(out);
    if(!parser.parse(argc, argv, cfg)) {
        if(parser.exit_code() != 0) err << parser.error() << "\n(see --help)\n";
        return parser.exit_code();
    }
    ConfigValidator validator;
    if(!validator.validate(cfg)) {
        err << validator.error() << "\n";
        return 2;
    }
    LogLevel level = LogLevel::Warn;
    parse_log_level(cfg.log_level, level);
    Logger::instance().set_level(level);

    // Registration completes before any run starts.
    ExampleRegistry registry;
    try {
        build(registry, cfg);
    } catch(const DuplicateNameError& ex) {
        err << "registration failed: " << ex.what() << "\n";
        return 3;
    } catch(const std::invalid_argument& ex) {
        err << "registration failed: " << ex.what() << "\n";
        return 3;
    }
    Logger::instance().debug("Registered " + std::to_string(registry.size()) + " examples");

    warn_unknown(registry, cfg.enable_examples, "--enable");
    warn_unknown(registry, cfg.disable_examples, "--disable");

    if(cfg.command == Command::List) {
        list_examples(registry, cfg, out);
        return 0;
    }

    warn_unknown(registry, cfg.simulate_unavailable, "--simulate-unavailable");

    Runner runner(registry, cfg);
    std::vector<RunResult> results;
    if(!cfg.run_name.empty()) {
        try {
            results.push_back(runner.run_one(cfg.run_name));
        } catch(const NotFoundError& ex) {
            err << ex.what() << "\n";
            return 2;
        }
    } else {
        results = runner.run_all();
    }

    std::string report = render(results, cfg);
    if(cfg.output_file.empty()) {
        out << report;
    } else {
        std::ofstream ofs(cfg.output_file);
        if(!ofs) {
            err << "cannot open output file: " << cfg.output_file << "\n";
            return 4;
        }
        ofs << report;
        if(!ofs) {
            err << "failed writing output file: " << cfg.output_file << "\n";
            return 4;
        }
    }
    return summarize(results).all_succeeded() ? 0 : 1;
}

}
