#include "JSONWriter.h"
#include "JsonUtil.h"
#include "Digest.h"
#include "Reporter.h"
#include "BuildInfo.h"
#include <map>
#include <sstream>
#include <cstdlib>

namespace pattern_harness {
namespace {
    struct JsonVal {
        enum Type { T_OBJ, T_ARR, T_STR, T_NUM, T_LIT } type = T_OBJ;
        std::map<std::string, JsonVal> obj;
        std::vector<JsonVal> arr;
        std::string str; // string text, number token or literal (true/false/null)
        JsonVal() = default;
        explicit JsonVal(Type t): type(t) {}
    };

    using jsonutil::escape;

    void put_str(JsonVal& o, const std::string& k, const std::string& v) {
        o.obj[k].type = JsonVal::T_STR;
        o.obj[k].str = v;
    }

    void put_num(JsonVal& o, const std::string& k, long long v) {
        o.obj[k].type = JsonVal::T_NUM;
        o.obj[k].str = std::to_string(v);
    }

    void put_bool(JsonVal& o, const std::string& k, bool v) {
        o.obj[k].type = JsonVal::T_LIT;
        o.obj[k].str = v ? "true" : "false";
    }

    void newline(std::ostream& os, int indent, int depth) {
        if(indent <= 0) return;
        os << '\n' << std::string(static_cast<std::size_t>(indent * depth), ' ');
    }

    // indent <= 0 emits compact output.
    void emit(const JsonVal& v, std::ostream& os, int indent, int depth) {
        switch(v.type) {
            case JsonVal::T_STR:
                os << '"' << escape(v.str) << '"';
                break;
            case JsonVal::T_NUM:
            case JsonVal::T_LIT:
                os << v.str;
                break;
            case JsonVal::T_ARR: {
                os << '[';
                bool first = true;
                for(const auto& e : v.arr) {
                    if(!first) os << ',';
                    first = false;
                    newline(os, indent, depth + 1);
                    emit(e, os, indent, depth + 1);
                }
                if(!v.arr.empty()) newline(os, indent, depth);
                os << ']';
                break;
            }
            case JsonVal::T_OBJ: {
                os << '{';
                bool first = true;
                for(const auto& kv : v.obj) {
                    if(!first) os << ',';
                    first = false;
                    newline(os, indent, depth + 1);
                    os << '"' << escape(kv.first) << '"' << ':';
                    if(indent > 0) os << ' ';
                    emit(kv.second, os, indent, depth + 1);
                }
                if(!v.obj.empty()) newline(os, indent, depth);
                os << '}';
                break;
            }
        }
    }

    std::string to_string(const JsonVal& v, int indent) {
        std::ostringstream os;
        emit(v, os, indent, 0);
        return os.str();
    }

    JsonVal build_meta(const Config& cfg) {
        JsonVal meta{JsonVal::T_OBJ};
        put_str(meta, "tool", "pattern-harness");
        put_str(meta, "tool_version", buildinfo::APP_VERSION);
        put_str(meta, "json_schema_version", "1");
        if(!std::getenv("PATTERN_HARNESS_CANON_TIME_ZERO")) {
            put_str(meta, "generated_at", jsonutil::time_to_iso(std::chrono::system_clock::now()));
        }
        JsonVal ec{JsonVal::T_OBJ};
        put_num(ec, "seed", static_cast<long long>(cfg.seed));
        put_num(ec, "time_budget_ms", cfg.time_budget_ms);
        if(!cfg.category.empty()) put_str(ec, "category", cfg.category);
        if(!cfg.run_name.empty()) put_str(ec, "name", cfg.run_name);
        put_bool(ec, "run_all", cfg.run_all);
        meta.obj["config"] = std::move(ec);
        return meta;
    }

    JsonVal build_summary(const std::vector<RunResult>& results) {
        RunSummary s = summarize(results);
        JsonVal o{JsonVal::T_OBJ};
        put_num(o, "total", static_cast<long long>(s.total));
        put_num(o, "success", static_cast<long long>(s.success));
        put_num(o, "failed", static_cast<long long>(s.failed));
        put_num(o, "errored", static_cast<long long>(s.errored));
        return o;
    }

    JsonVal build_result(const RunResult& r) {
        JsonVal o{JsonVal::T_OBJ};
        put_str(o, "name", r.name);
        put_str(o, "status", status_name(r.status));
        put_str(o, "state", state_name(r.state));
        put_num(o, "duration_ms", static_cast<long long>(r.duration.count()));
        put_num(o, "line_count", static_cast<long long>(r.output.size()));
        put_str(o, "output_sha256", output_digest(r.output));
        if(r.failure_reason) put_str(o, "failure_reason", *r.failure_reason);
        JsonVal lines{JsonVal::T_ARR};
        for(const auto& l : r.output) {
            JsonVal s{JsonVal::T_STR};
            s.str = l;
            lines.arr.push_back(std::move(s));
        }
        o.obj["output"] = std::move(lines);
        return o;
    }
}

std::string JSONWriter::write(const std::vector<RunResult>& results, const Config& cfg) const {
    JsonVal root{JsonVal::T_OBJ};
    root.obj["meta"] = build_meta(cfg);
    root.obj["summary"] = build_summary(results);
    JsonVal arr{JsonVal::T_ARR};
    for(const auto& r : results) arr.arr.push_back(build_result(r));
    root.obj["results"] = std::move(arr);
    int indent = (cfg.pretty && !cfg.compact) ? 2 : 0;
    return to_string(root, indent) + "\n";
}

std::string JSONWriter::write_ndjson(const std::vector<RunResult>& results, const Config& cfg) const {
    std::ostringstream os;
    JsonVal meta = build_meta(cfg);
    put_str(meta, "record", "meta");
    os << to_string(meta, 0) << '\n';
    JsonVal summary = build_summary(results);
    put_str(summary, "record", "summary");
    os << to_string(summary, 0) << '\n';
    for(const auto& r : results) {
        JsonVal o = build_result(r);
        put_str(o, "record", "result");
        os << to_string(o, 0) << '\n';
    }
    return os.str();
}

}
