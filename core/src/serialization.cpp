#include "gradebench/serialization.h"
#include "gradebench/json_util.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace gradebench {

// --- field helpers ---

static std::string field(const std::string& where, const char* k) {
    return where.empty() ? std::string(k) : where + "." + k;
}

static std::string at_index(const std::string& where, size_t i) {
    return where + "[" + std::to_string(i) + "]";
}

static bool is_null_or_absent(json_object* o, const char* k) {
    json_object* v = nullptr;
    return !json_object_object_get_ex(o, k, &v) || v == nullptr;
}

static void require_object(json_object* o, const std::string& where) {
    if (!o || !json_object_is_type(o, json_type_object)) throw SchemaError(where + ": expected object");
}

static std::string require_string(json_object* o, const char* k, const std::string& where) {
    std::string s;
    if (!json_util::get_string(o, k, &s)) throw SchemaError(field(where, k) + ": expected string");
    return s;
}

static json_object* require_array(json_object* o, const char* k, const std::string& where) {
    json_object* a = json_util::get_typed(o, k, json_type_array);
    if (!a) throw SchemaError(field(where, k) + ": expected array");
    return a;
}

// Absent or null -> nullptr; present with the wrong type -> SchemaError.
static json_object* optional_typed(json_object* o, const char* k, json_type t, const char* what,
                                   const std::string& where) {
    if (is_null_or_absent(o, k)) return nullptr;
    json_object* v = json_util::get_typed(o, k, t);
    if (!v) throw SchemaError(field(where, k) + ": expected " + what);
    return v;
}

static std::string raw_json(json_object* v) {
    return json_util::to_string(v);
}

// --- test cases and prototypes ---

TestCase test_case_from_json(json_object* o, const std::string& where) {
    require_object(o, where);
    json_object* in = json_util::get_typed(o, "input", json_type_object);
    if (!in) throw SchemaError(field(where, "input") + ": expected object");
    json_object* exp = require_array(o, "expected_output", where);

    TestCase tc;
    json_object_object_foreach(in, k, v) {
        tc.input[k] = value_from_json(v);
    }
    const size_t n = json_object_array_length(exp);
    for (size_t i = 0; i < n; i++) tc.expected_output.push_back(value_from_json(json_object_array_get_idx(exp, i)));
    return tc;
}

static std::vector<TestCase> test_cases_from(json_object* arr, const std::string& where) {
    std::vector<TestCase> out;
    if (!arr) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) out.push_back(test_case_from_json(json_object_array_get_idx(arr, i), at_index(where, i)));
    return out;
}

FunctionPrototype prototype_from_json(json_object* o, const std::string& where) {
    require_object(o, where);
    FunctionPrototype fp;
    fp.function_name = require_string(o, "function_name", where);

    json_object* params = require_array(o, "parameters", where);
    for (size_t i = 0; i < json_object_array_length(params); i++) {
        const std::string w = at_index(field(where, "parameters"), i);
        json_object* p = json_object_array_get_idx(params, i);
        require_object(p, w);
        fp.parameters.push_back(Parameter{require_string(p, "name", w), require_string(p, "type", w)});
    }

    json_object* rets = require_array(o, "return_values", where);
    for (size_t i = 0; i < json_object_array_length(rets); i++) {
        const std::string w = at_index(field(where, "return_values"), i);
        json_object* r = json_object_array_get_idx(rets, i);
        require_object(r, w);
        fp.return_values.push_back(ReturnValue{require_string(r, "type", w)});
    }
    return fp;
}

static json_object* prototype_to_json(const FunctionPrototype& fp) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "function_name", json_util::new_string(fp.function_name));
    json_object* params = json_object_new_array();
    for (const auto& p : fp.parameters) {
        json_object* po = json_object_new_object();
        json_object_object_add(po, "name", json_util::new_string(p.name));
        json_object_object_add(po, "type", json_util::new_string(p.type));
        json_object_array_add(params, po);
    }
    json_object_object_add(o, "parameters", params);
    json_object* rets = json_object_new_array();
    for (const auto& r : fp.return_values) {
        json_object* ro = json_object_new_object();
        json_object_object_add(ro, "type", json_util::new_string(r.type));
        json_object_array_add(rets, ro);
    }
    json_object_object_add(o, "return_values", rets);
    return o;
}

json_object* test_case_to_json(const TestCase& tc) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "input", value_to_json(Value(tc.input)));
    json_object_object_add(o, "expected_output", value_to_json(Value(tc.expected_output)));
    return o;
}

static json_object* test_cases_to_json(const std::vector<TestCase>& cases) {
    json_object* a = json_object_new_array();
    for (const auto& tc : cases) json_object_array_add(a, test_case_to_json(tc));
    return a;
}

// --- problems ---

ProblemDefinition problem_from_json(json_object* o) {
    require_object(o, "problem");
    ProblemDefinition p;
    p.identifier = require_string(o, "identifier", "");
    const std::string where = "problem '" + p.identifier + "'";

    json_object* fp = json_util::get_typed(o, "function_prototype", json_type_object);
    if (!fp) throw SchemaError(where + ": function_prototype: expected object");
    p.function_prototype = prototype_from_json(fp, where + ": function_prototype");

    json_object* prompts = require_array(o, "prompts", where);
    for (size_t i = 0; i < json_object_array_length(prompts); i++) {
        const std::string w = at_index(where + ": prompts", i);
        json_object* po = json_object_array_get_idx(prompts, i);
        require_object(po, w);
        Prompt pr;
        pr.prompt_id = require_string(po, "prompt_id", w);
        pr.prompt = require_string(po, "prompt", w);
        if (json_object* g = optional_typed(po, "genericize", json_type_boolean, "boolean", w)) {
            pr.genericize = json_object_get_boolean(g) != 0;
        }
        pr.sample_inputs_outputs = test_cases_from(
            optional_typed(po, "sample_inputs_outputs", json_type_array, "array", w),
            field(w, "sample_inputs_outputs"));
        if (json_object* ic = optional_typed(po, "input_code", json_type_string, "string", w)) {
            pr.input_code = std::string(json_object_get_string(ic));
        }
        p.prompts.push_back(std::move(pr));
    }

    p.correctness_test_suite = test_cases_from(
        optional_typed(o, "correctness_test_suite", json_type_array, "array", where),
        where + ": correctness_test_suite");
    if (json_object* os = optional_typed(o, "optimal_solution", json_type_string, "string", where)) {
        p.optimal_solution = std::string(json_object_get_string(os));
    }
    if (json_object* tags = optional_typed(o, "tags", json_type_array, "array", where)) {
        std::vector<std::string> t;
        for (size_t i = 0; i < json_object_array_length(tags); i++) {
            json_object* el = json_object_array_get_idx(tags, i);
            if (!el || !json_object_is_type(el, json_type_string)) {
                throw SchemaError(at_index(where + ": tags", i) + ": expected string");
            }
            t.emplace_back(json_object_get_string(el));
        }
        p.tags = std::move(t);
    }

    static const char* known[] = {"identifier", "prompts", "function_prototype",
                                  "correctness_test_suite", "optimal_solution", "tags"};
    json_object_object_foreach(o, k, v) {
        bool is_known = std::any_of(std::begin(known), std::end(known),
                                    [&](const char* n) { return std::string(n) == k; });
        if (!is_known) p.additional_fields[k] = raw_json(v);
    }
    return p;
}

json_object* problem_to_json(const ProblemDefinition& p) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "identifier", json_util::new_string(p.identifier));
    json_object* prompts = json_object_new_array();
    for (const auto& pr : p.prompts) {
        json_object* po = json_object_new_object();
        json_object_object_add(po, "prompt_id", json_util::new_string(pr.prompt_id));
        json_object_object_add(po, "prompt", json_util::new_string(pr.prompt));
        json_object_object_add(po, "genericize", json_object_new_boolean(pr.genericize ? 1 : 0));
        json_object_object_add(po, "sample_inputs_outputs", test_cases_to_json(pr.sample_inputs_outputs));
        json_object_object_add(po, "input_code", pr.input_code ? json_util::new_string(*pr.input_code) : nullptr);
        json_object_array_add(prompts, po);
    }
    json_object_object_add(o, "prompts", prompts);
    json_object_object_add(o, "function_prototype", prototype_to_json(p.function_prototype));
    json_object_object_add(o, "correctness_test_suite", test_cases_to_json(p.correctness_test_suite));
    json_object_object_add(o, "optimal_solution",
                           p.optimal_solution ? json_util::new_string(*p.optimal_solution) : nullptr);
    if (p.tags) {
        json_object* tags = json_object_new_array();
        for (const auto& t : *p.tags) json_object_array_add(tags, json_util::new_string(t));
        json_object_object_add(o, "tags", tags);
    } else {
        json_object_object_add(o, "tags", nullptr);
    }
    for (const auto& kv : p.additional_fields) {
        json_util::Doc d = json_util::parse(kv.second);
        json_object_object_add(o, kv.first.c_str(), d ? d.release() : json_util::new_string(kv.second));
    }
    return o;
}

// --- solutions ---

LLMSolution solution_from_json(json_object* o) {
    require_object(o, "solution");
    LLMSolution s;
    s.problem_identifier = require_string(o, "problem_identifier", "solution");
    s.model_identifier = require_string(o, "model_identifier", "solution");
    s.prompt_identifier = require_string(o, "prompt_identifier", "solution");
    s.solution_code = require_string(o, "solution_code", "solution");
    if (!is_null_or_absent(o, "feedback")) {
        json_object* fb = nullptr;
        json_object_object_get_ex(o, "feedback", &fb);
        s.feedback = raw_json(fb);
    }
    return s;
}

json_object* solution_to_json(const LLMSolution& s) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "problem_identifier", json_util::new_string(s.problem_identifier));
    json_object_object_add(o, "model_identifier", json_util::new_string(s.model_identifier));
    json_object_object_add(o, "prompt_identifier", json_util::new_string(s.prompt_identifier));
    json_object_object_add(o, "solution_code", json_util::new_string(s.solution_code));
    json_object* fb = nullptr;
    if (s.feedback) {
        json_util::Doc d = json_util::parse(*s.feedback);
        fb = d ? d.release() : json_util::new_string(*s.feedback);
    }
    json_object_object_add(o, "feedback", fb);
    return o;
}

// --- grades ---

SolutionGrade grade_from_json(json_object* o, const std::string& where) {
    require_object(o, where);
    SolutionGrade g;
    g.problem_identifier = require_string(o, "problem_identifier", where);
    g.prompt_identifier = require_string(o, "prompt_identifier", where);
    g.model_identifier = require_string(o, "model_identifier", where);
    if (!json_util::get_double(o, "score", &g.score)) throw SchemaError(field(where, "score") + ": expected number");

    if (json_object* sub = optional_typed(o, "sub_criteria_scores", json_type_object, "object", where)) {
        SubCriteriaScores scores;
        json_object_object_foreach(sub, k, v) {
            if (!v || !(json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int))) {
                throw SchemaError(field(where, "sub_criteria_scores") + "." + k + ": expected number");
            }
            scores[k] = json_object_get_double(v);
        }
        g.sub_criteria_scores = std::move(scores);
    }
    if (json_object* issues = optional_typed(o, "issues", json_type_array, "array", where)) {
        for (size_t i = 0; i < json_object_array_length(issues); i++) {
            const std::string w = at_index(field(where, "issues"), i);
            json_object* io = json_object_array_get_idx(issues, i);
            require_object(io, w);
            g.issues.push_back(Issue{require_string(io, "issue_category", w),
                                     require_string(io, "issue_description", w)});
        }
    }
    return g;
}

json_object* grade_to_json(const SolutionGrade& g) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "problem_identifier", json_util::new_string(g.problem_identifier));
    json_object_object_add(o, "prompt_identifier", json_util::new_string(g.prompt_identifier));
    json_object_object_add(o, "model_identifier", json_util::new_string(g.model_identifier));
    json_object_object_add(o, "score", json_object_new_double(g.score));
    json_object* sub = nullptr;
    if (g.sub_criteria_scores) {
        sub = json_object_new_object();
        for (const auto& kv : *g.sub_criteria_scores) {
            json_object_object_add(sub, kv.first.c_str(), json_object_new_double(kv.second));
        }
    }
    json_object_object_add(o, "sub_criteria_scores", sub);
    json_object* issues = json_object_new_array();
    for (const auto& is : g.issues) {
        json_object* io = json_object_new_object();
        json_object_object_add(io, "issue_category", json_util::new_string(is.category));
        json_object_object_add(io, "issue_description", json_util::new_string(is.description));
        json_object_array_add(issues, io);
    }
    json_object_object_add(o, "issues", issues);
    return o;
}

GradingOutput grading_output_from_json(json_object* o) {
    require_object(o, "grading_output");
    GradingOutput out;
    out.grader_identifier = require_string(o, "grader_identifier", "grading_output");
    json_object* grades = require_array(o, "solution_grades", "grading_output");
    for (size_t i = 0; i < json_object_array_length(grades); i++) {
        out.solution_grades.push_back(grade_from_json(json_object_array_get_idx(grades, i),
                                                      at_index("grading_output.solution_grades", i)));
    }
    return out;
}

json_object* grading_output_to_json(const GradingOutput& out) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "grader_identifier", json_util::new_string(out.grader_identifier));
    json_object_object_add(o, "overall_score", json_object_new_double(out.overall_score()));
    json_object* grades = json_object_new_array();
    for (const auto& g : out.solution_grades) json_object_array_add(grades, grade_to_json(g));
    json_object_object_add(o, "solution_grades", grades);
    return o;
}

// --- reports ---

ProblemSetMemberships memberships_from_json(json_object* o) {
    require_object(o, "memberships");
    ProblemSetMemberships m;
    // {"problem": "set"} or {"set": ["problem", ...]}
    json_object_object_foreach(o, k, v) {
        if (v && json_object_is_type(v, json_type_string)) {
            m[k] = json_object_get_string(v);
        } else if (v && json_object_is_type(v, json_type_array)) {
            for (size_t i = 0; i < json_object_array_length(v); i++) {
                json_object* el = json_object_array_get_idx(v, i);
                if (!el || !json_object_is_type(el, json_type_string)) {
                    throw SchemaError(at_index(std::string("memberships.") + k, i) + ": expected string");
                }
                m[json_object_get_string(el)] = k;
            }
        } else {
            throw SchemaError(std::string("memberships.") + k + ": expected string or array");
        }
    }
    return m;
}

static json_object* averages_to_json(const std::map<std::string, double>& avgs) {
    json_object* o = json_object_new_object();
    for (const auto& kv : avgs) json_object_object_add(o, kv.first.c_str(), json_object_new_double(kv.second));
    return o;
}

json_object* report_to_json(const Report& r) {
    json_object* models = json_object_new_object();
    for (const auto& kv : r.models) {
        const ModelReport& mr = kv.second;
        json_object* mo = json_object_new_object();
        json_object_object_add(mo, "grader_averages", averages_to_json(mr.grader_averages));
        json_object* sets = json_object_new_object();
        for (const auto& s : mr.problem_set_averages) {
            json_object_object_add(sets, s.first.c_str(), averages_to_json(s.second));
        }
        json_object_object_add(mo, "problem_set_averages", sets);
        json_object_object_add(mo, "problem_set_overall", averages_to_json(mr.problem_set_overall));
        json_object_object_add(mo, "criterion_averages", averages_to_json(mr.criterion_averages));
        json_object* grades = json_object_new_array();
        for (const auto& tg : mr.grades) {
            json_object* go = grade_to_json(tg.grade);
            json_object_object_add(go, "grader_identifier", json_util::new_string(tg.grader_identifier));
            json_object_array_add(grades, go);
        }
        json_object_object_add(mo, "grades", grades);
        json_object_object_add(models, kv.first.c_str(), mo);
    }
    json_object* root = json_object_new_object();
    json_object_object_add(root, "models", models);
    return root;
}

// --- files ---

std::string read_text_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open " + path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

template <typename T, typename Parse>
static std::vector<T> load_items(const std::string& path, Parse parse) {
    json_util::Doc doc = json_util::parse(read_text_file(path));
    if (!doc) throw SchemaError(path + ": invalid JSON");
    std::vector<T> out;
    try {
        if (json_object_is_type(doc.root, json_type_array)) {
            for (size_t i = 0; i < json_object_array_length(doc.root); i++) {
                out.push_back(parse(json_object_array_get_idx(doc.root, i)));
            }
        } else {
            out.push_back(parse(doc.root));
        }
    } catch (const SchemaError& e) {
        throw SchemaError(path + ": " + e.what());
    }
    return out;
}

std::vector<ProblemDefinition> load_problems_file(const std::string& path) {
    return load_items<ProblemDefinition>(path, [](json_object* o) { return problem_from_json(o); });
}

std::vector<LLMSolution> load_solutions_file(const std::string& path) {
    return load_items<LLMSolution>(path, [](json_object* o) { return solution_from_json(o); });
}

std::vector<GradingOutput> load_grading_outputs_file(const std::string& path) {
    return load_items<GradingOutput>(path, [](json_object* o) { return grading_output_from_json(o); });
}

std::vector<std::string> list_json_files(const std::string& dir, bool recursive) {
    namespace fs = std::filesystem;
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) throw std::runtime_error("not a directory: " + dir);

    auto consider = [&](const fs::directory_entry& e) {
        const std::string name = e.path().filename().string();
        if (name.empty() || name[0] == '.') return;
        if (e.is_regular_file(ec) && e.path().extension() == ".json") out.push_back(e.path().string());
    };
    if (recursive) {
        for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            const std::string name = it->path().filename().string();
            if (!name.empty() && name[0] == '.' && it->is_directory(ec)) {
                it.disable_recursion_pending();
                continue;
            }
            consider(*it);
        }
    } else {
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) consider(*it);
    }
    if (ec) throw std::runtime_error("cannot list " + dir + ": " + ec.message());
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace gradebench
