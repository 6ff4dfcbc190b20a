// Implementation of the generation driver

#include "driver.hpp"

#include "emit.hpp"
#include "integration.hpp"
#include "log.hpp"
#include "path_utils.hpp"
#include "roundtrip.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <set>

namespace fixturegen::codegen {
namespace {

bool is_selected(const GeneratorOptions &options, const std::string &name) {
    return options.only.empty() || std::find(options.only.begin(), options.only.end(), name) != options.only.end();
}

// Every --only name must name a fixture of this run.
bool validate_selection(const GeneratorOptions &options, const std::vector<FixtureSpec> &integration,
                        const std::vector<FixtureSpec> &table) {
    std::set<std::string> known;
    for (const auto &spec : integration) {
        known.insert(spec.name);
    }
    for (const auto &spec : table) {
        known.insert(spec.name);
    }
    bool ok = true;
    for (const auto &name : options.only) {
        if (!known.contains(name)) {
            log_err("unknown fixture '{}' (see --list)", name);
            ok = false;
        }
    }
    return ok;
}

struct Totals {
    std::size_t entries     = 0;
    std::size_t ignored     = 0;
    std::size_t out_of_date = 0;

    void add(const GenerationReport &report) {
        entries += report.entry_count;
        ignored += report.ignored_count;
        if (report.out_of_date) {
            ++out_of_date;
        }
    }
};

int run_porter(const FixtureSpec &spec, const GenerationContext &ctx, SyntaxBackend *backend) {
    if (ctx.options.check_only) {
        return 0;
    }
    if (backend == nullptr) {
        log_note("no round-trip printer configured; not porting '{}' into '{}'", spec.roundtrip_source->generic_string(),
                 spec.source_dir.generic_string());
        return 0;
    }
    return port_roundtrip_cases(resolve_against(ctx.testcases_root, *spec.roundtrip_source),
                                resolve_against(ctx.testcases_root, spec.source_dir), ctx.options.extension, *backend);
}

} // namespace

int run_generation(const GeneratorOptions &options, const std::vector<FixtureSpec> &table, SyntaxBackend *backend) {
    const auto ctx = make_context(options);

    const auto integration = discover_integration_fixtures(ctx.testcases_root);
    if (!integration) {
        return 1;
    }
    if (!validate_selection(options, *integration, table)) {
        return 1;
    }

    fmt::print("{}\n", format_report_header());

    Totals totals;
    auto   generate = [&](const FixtureSpec &spec) {
        GenerationReport report;
        const int        status = generate_fixture(spec, ctx, report);
        totals.add(report);
        return status;
    };

    for (const auto &spec : *integration) {
        if (is_selected(options, spec.name) && generate(spec) != 0) {
            return 1;
        }
    }
    for (const auto &spec : table) {
        if (!is_selected(options, spec.name)) {
            continue;
        }
        if (spec.roundtrip_source && run_porter(spec, ctx, backend) != 0) {
            return 1;
        }
        if (generate(spec) != 0) {
            return 1;
        }
    }

    fmt::print("{:>7} {:>7}  total\n", totals.entries, totals.ignored);
    if (totals.out_of_date != 0) {
        log_err("{} generated file(s) out of date; run without --check to regenerate", totals.out_of_date);
        return 1;
    }
    return 0;
}

int list_fixtures(const GeneratorOptions &options, const std::vector<FixtureSpec> &table) {
    const auto ctx         = make_context(options);
    const auto integration = discover_integration_fixtures(ctx.testcases_root);
    if (!integration) {
        return 1;
    }
    auto print_spec = [](const FixtureSpec &spec) {
        fmt::print("{:<36} {:<32} {}\n", spec.name, spec.source_dir.generic_string(), spec.target_file.generic_string());
    };
    for (const auto &spec : *integration) {
        print_spec(spec);
    }
    for (const auto &spec : table) {
        print_spec(spec);
    }
    return 0;
}

} // namespace fixturegen::codegen
