#include "grainguard/analysis.hpp"
#include "grainguard/blacklist.hpp"
#include "grainguard/config.hpp"
#include "grainguard/dataset_store.hpp"
#include "grainguard/engine/sqlite_engine.hpp"
#include "grainguard/filter_compiler.hpp"
#include "grainguard/filter_parse.hpp"
#include "grainguard/grain.hpp"
#include "grainguard/query_executor.hpp"
#include "grainguard/schema_descriptor.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

using grainguard::analysis_request;
using grainguard::analysis_runner;
using grainguard::dataset_store;
using grainguard::engine_config;
using grainguard::filter_rule;
using grainguard::query_executor;
using grainguard::engine::sqlite_engine;

namespace {
struct Args {
    std::string command;
    std::string dataset;
    std::vector<std::string> filters;   // column:op:value
    std::string logic{"AND"};
    std::string format{"csv"};
    std::string column;
    std::size_t limit{0};               // 0 = config default
    std::string analysis;
    std::string granularity{"day"};
    std::optional<std::string> input_dir;
    std::optional<std::string> output_dir;
};

static std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static void print_usage() {
    std::cout << "GrainGuard dataset tool\n"
              << "Usage: grainguard_cli <command> --dataset=id [options]\n"
              << "Commands:\n"
              << "  inspect   columns, detected grains, blacklist findings, available analyses\n"
              << "  preview   count rows matching the filters\n"
              << "  export    write <output_dir>/<id>_filtered.<csv|xlsx>\n"
              << "  sample    first rows and total row count\n"
              << "  distinct  distinct values of --column\n"
              << "  analyze   run --analysis=key (time_trend, top_products, top_members, aov, new_vs_returning)\n"
              << "Options:\n"
              << "  [--filter=column:op:value]... [--logic=AND|OR] [--format=csv|xlsx]\n"
              << "  [--column=name] [--limit=N] [--analysis=key] [--granularity=day|month]\n"
              << "  [--input_dir=path] [--output_dir=path]\n"
              << "Environment: GRAINGUARD_INPUT_DIR, GRAINGUARD_OUTPUT_DIR, GRAINGUARD_EXEC_TIMEOUT_MS,\n"
              << "  GRAINGUARD_ROW_LIMIT, GRAINGUARD_MAX_ROW_LIMIT, GRAINGUARD_DEBUG\n";
}

static int fail(const grainguard::core::error& e) {
    std::cerr << "error: " << grainguard::core::to_string(e.code) << " (" << static_cast<std::uint32_t>(e.code)
              << ") " << e.message << " [" << e.component << "]\n";
    return 1;
}

static void print_cell(const grainguard::cell_value& v) {
    if (grainguard::is_null(v)) std::cout << "NULL";
    else std::cout << grainguard::to_text(v);
}

static void print_finding(const grainguard::blacklist_finding& f) {
    std::cout << "  [" << grainguard::to_string(f.level) << "] "
              << (f.scope ? grainguard::to_string(*f.scope) : std::string_view{"all"}) << " ";
    for (std::size_t i = 0; i < f.metrics.size(); ++i) std::cout << (i ? "," : "") << f.metrics[i];
    std::cout << ": " << f.reason << " (" << f.rule << ")\n";
}
}

int main(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") { print_usage(); return 0; }
        else if (auto v = eat(a, "--dataset=")) args.dataset = *v;
        else if (auto v = eat(a, "--filter=")) args.filters.push_back(*v);
        else if (auto v = eat(a, "--logic=")) args.logic = *v;
        else if (auto v = eat(a, "--format=")) args.format = *v;
        else if (auto v = eat(a, "--column=")) args.column = *v;
        else if (auto v = eat(a, "--limit=")) {
            auto n = grainguard::parse_scalar_token(*v);
            const auto* p = std::get_if<std::int64_t>(&n);
            if (!p || *p < 0) { std::cerr << "--limit must be a non-negative integer\n"; return 2; }
            args.limit = static_cast<std::size_t>(*p);
        }
        else if (auto v = eat(a, "--analysis=")) args.analysis = *v;
        else if (auto v = eat(a, "--granularity=")) args.granularity = *v;
        else if (auto v = eat(a, "--input_dir=")) args.input_dir = *v;
        else if (auto v = eat(a, "--output_dir=")) args.output_dir = *v;
        else if (args.command.empty() && a.rfind("--", 0) != 0) args.command = a;
        else { std::cerr << "Unknown argument: " << a << "\n"; print_usage(); return 2; }
    }
    if (args.command.empty() || args.dataset.empty()) { print_usage(); return 2; }

    auto cfg_r = grainguard::load_config_from_env();
    if (!cfg_r) return fail(cfg_r.error());
    engine_config cfg = *cfg_r;
    if (args.input_dir) cfg.input_dir = *args.input_dir;
    if (args.output_dir) cfg.output_dir = *args.output_dir;

    dataset_store store(cfg.input_dir);
    auto handle = store.resolve(args.dataset);
    if (!handle) return fail(handle.error());

    sqlite_engine engine;

    if (args.command == "inspect") {
        analysis_runner runner(engine, cfg);
        auto p = runner.inspect(*handle);
        if (!p) return fail(p.error());
        std::cout << "dataset: " << handle->id << "\ncolumns:\n";
        for (const auto& c : p->columns) {
            std::cout << "  " << c.name << " " << grainguard::to_string(c.type) << " (" << c.declared_type_name
                      << (c.nullable ? ", nullable" : "") << ")\n";
        }
        std::cout << "grains:";
        for (auto g : p->grains) std::cout << " " << grainguard::to_string(g);
        std::cout << "\nblacklist:\n";
        for (const auto& f : p->findings) print_finding(f);
        std::cout << "available analyses:\n";
        for (const auto& a : p->available) std::cout << "  " << a.key << " - " << a.label << "\n";
        return 0;
    }

    query_executor exec(engine, cfg);

    if (args.command == "preview" || args.command == "export") {
        std::vector<filter_rule> rules;
        for (const auto& f : args.filters) {
            auto r = grainguard::parse_filter_arg(f);
            if (!r) return fail(r.error());
            rules.push_back(std::move(*r));
        }
        auto logic = grainguard::parse_logic(args.logic);
        if (!logic) return fail(logic.error());

        if (args.command == "preview") {
            auto r = exec.preview_filtered(*handle, rules, *logic);
            if (!r) return fail(r.error());
            std::cout << "matched_rows=" << r->matched_rows << " elapsed_ms=" << r->elapsed.count() << "\n";
            return 0;
        }
        auto fmt = grainguard::parse_export_format(args.format);
        if (!fmt) return fail(fmt.error());
        auto r = exec.export_filtered(*handle, rules, *logic, *fmt);
        if (!r) return fail(r.error());
        std::cout << "wrote " << r->path.string() << " (" << r->media_type << ", rows=" << r->rows << ")\n";
        return 0;
    }

    if (args.command == "sample") {
        auto r = exec.sample_rows(*handle, args.limit);
        if (!r) return fail(r.error());
        for (std::size_t i = 0; i < r->columns.size(); ++i) std::cout << (i ? "\t" : "") << r->columns[i];
        std::cout << "\n";
        for (const auto& row : r->rows) {
            for (std::size_t i = 0; i < row.size(); ++i) { if (i) std::cout << "\t"; print_cell(row[i]); }
            std::cout << "\n";
        }
        std::cout << "total_rows=" << r->total_rows << "\n";
        return 0;
    }

    if (args.command == "distinct") {
        if (args.column.empty()) { std::cerr << "distinct requires --column\n"; return 2; }
        auto r = exec.distinct_values(*handle, args.column, args.limit);
        if (!r) return fail(r.error());
        for (const auto& v : *r) { print_cell(v); std::cout << "\n"; }
        return 0;
    }

    if (args.command == "analyze") {
        if (args.analysis.empty()) { std::cerr << "analyze requires --analysis\n"; return 2; }
        analysis_request req;
        req.key = args.analysis;
        req.granularity = args.granularity;
        if (args.limit) req.limit = static_cast<std::int64_t>(args.limit);
        analysis_runner runner(engine, cfg);
        auto r = runner.run(*handle, req);
        if (!r) return fail(r.error());
        std::cout << "analysis=" << r->key << " metric=" << r->metric << " dimension=" << r->dimension;
        if (r->granularity) std::cout << " granularity=" << *r->granularity;
        if (r->limit) std::cout << " limit=" << *r->limit;
        std::cout << "\n";
        for (const auto& pt : r->points) {
            std::cout << "  ";
            print_cell(pt.key);
            std::cout << "\t";
            print_cell(pt.value);
            std::cout << "\n";
        }
        if (!r->warnings.empty()) {
            std::cout << "warnings:\n";
            for (const auto& f : r->warnings) print_finding(f);
        }
        return 0;
    }

    std::cerr << "Unknown command: " << args.command << "\n";
    print_usage();
    return 2;
}
