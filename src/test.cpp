// ============================================================================
// test.cpp — Self-test suite for the tracefit tool
// ============================================================================
//
// Contains tests covering:
//   - Symbol and trace decoding (separators, length errors)
//   - The built-in model and the model file loader
//   - ExtensionSet persistence and order-independent equality
//   - Search engine: start-state choice, reuse, new states, no completion
//   - Cross-checks against an exhaustive enumeration and the Z3 optimiser
//   - Report text and completed-transducer serialisation
//   - Command-line parsing
//
// ============================================================================

#include "tracefit/test.hpp"
#include "tracefit/cli.hpp"
#include "tracefit/extension_set.hpp"
#include "tracefit/report.hpp"
#include "tracefit/search.hpp"
#include "tracefit/trace.hpp"
#include "tracefit/transducer.hpp"
#include "tracefit/utils.hpp"
#include "tracefit/z3_solver.hpp"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tracefit {

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

void TestContext::check_eq(long long actual, long long expected,
                           const std::string& description) {
    check_eq(std::to_string(actual), std::to_string(expected), description);
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::run(const std::string& name, TestFunc func) {
    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

// ============================================================================
// Helpers
// ============================================================================

// Single state A, every input defined with output 0.
static const std::vector<std::string> kClosedModel = {
    "A 00 A 0",
    "A 01 A 0",
    "A 10 A 0",
    "A 11 A 0",
};

// A lacks 00; every other transition is defined with output 0, so an
// output of 1 after the first step needs a state that does not exist yet.
static const std::vector<std::string> kNewStateModel = {
    "# from input to output",
    "A 01 A 0",
    "A 10 A 0",
    "A 11 A 0",
    "",
    "B 00 A 0   # B is never a useful start",
    "B 01 A 0",
    "B 10 A 0",
    "B 11 A 0",
};

static std::optional<Completion> solve_raw(const TransducerModel& model,
                                           const std::string& trace) {
    SearchEngine engine(model);
    return engine.solve(decode_trace(trace));
}

static bool model_fails(const std::vector<std::string>& lines, std::uint32_t line) {
    try {
        parse_model(lines);
        return false;
    } catch (const ModelError& e) {
        return e.line() == line;
    }
}

static bool reproduces(const TransducerModel& model, const Completion& c,
                       const std::vector<Step>& steps) {
    CompletedTransducer machine(model, c);
    auto produced = simulate(machine, steps);
    return produced && *produced == required_outputs(steps);
}

static int count_occurrences(const std::string& text, const std::string& needle) {
    int n = 0;
    for (auto pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

// Exhaustive enumeration of visited-state sequences over the states
// [0, P + n).  Independent of the search engine: it checks every sequence
// for consistency with the predefined table and with itself, and prices it
// as (distinct non-predefined pairs used) + (distinct new states visited).
static std::optional<int> brute_force_cost(const TransducerModel& model,
                                           const std::vector<Step>& steps) {
    const std::size_t P = model.num_states();
    const std::size_t n = steps.size();
    const std::size_t U = P + n;

    std::vector<std::size_t> seq(n + 1, 0);
    std::optional<int> best;

    while (true) {
        std::map<std::pair<std::size_t, InputSymbol>, std::pair<std::size_t, char>> added;
        std::set<std::size_t> fresh;
        bool ok = true;

        for (std::size_t i = 0; i < n && ok; ++i) {
            const std::size_t q  = seq[i];
            const std::size_t to = seq[i + 1];
            const Step& step = steps[i];
            if (to >= P) fresh.insert(to);

            if (q < P) {
                auto edge = model.lookup(State::predefined(static_cast<std::uint32_t>(q)),
                                         step.input);
                if (edge) {
                    ok = edge->to.index == to && edge->output == step.output;
                    continue;
                }
            }
            auto value = std::make_pair(to, step.output);
            auto [it, inserted] = added.emplace(std::make_pair(q, step.input), value);
            if (!inserted && it->second != value) ok = false;
        }

        if (ok) {
            int cost = static_cast<int>(added.size() + fresh.size());
            if (!best || cost < *best) best = cost;
        }

        // Advance the odometer; seq[0] ranges over predefined states only.
        std::size_t k = 0;
        while (k <= n) {
            ++seq[k];
            if (seq[k] < (k == 0 ? P : U)) break;
            seq[k] = 0;
            ++k;
        }
        if (k > n) break;
    }
    return best;
}

static std::string random_trace(std::mt19937& rng, std::size_t steps) {
    std::uniform_int_distribution<int> bit(0, 1);
    std::string trace;
    for (std::size_t i = 0; i < steps * kStepWidth; ++i) {
        trace += static_cast<char>('0' + bit(rng));
    }
    return trace;
}

// ============================================================================
// Decoding Tests
// ============================================================================

static void test_input_symbols(TestContext& ctx) {
    ctx.check(parse_input("00") == InputSymbol{0}, "00 is code 0");
    ctx.check(parse_input("01") == InputSymbol{1}, "01 is code 1");
    ctx.check(parse_input("10") == InputSymbol{2}, "10 is code 2");
    ctx.check(parse_input("11") == InputSymbol{3}, "11 is code 3");
    ctx.check(!parse_input("1"), "single bit rejected");
    ctx.check(!parse_input("012"), "three bits rejected");
    ctx.check(!parse_input("0a"), "non-binary rejected");
    for (InputSymbol in = 0; in < kInputAlphabetSize; ++in) {
        ctx.check(parse_input(input_to_string(in)) == in,
                  "input " + input_to_string(in) + " renders back");
    }
}

static void test_decode_demo_trace(TestContext& ctx) {
    auto steps = decode_trace("001_010_010_101_100_001_110_110");
    ctx.check_eq(static_cast<long long>(steps.size()), 8, "demo trace has 8 steps");
    ctx.check_eq(format_steps(steps), "00/1 01/0 01/0 10/1 10/0 00/1 11/0 11/0",
                 "demo trace steps");
    ctx.check_eq(static_cast<long long>(steps[5].index), 5, "step index kept");

    auto same = decode_trace("001010010101100001110110");
    ctx.check_eq(format_steps(same), format_steps(steps), "separators are optional");
}

static void test_decode_separators(TestContext& ctx) {
    ctx.check_eq(clean_trace("0 1-x1\t"), "011", "non-binary characters dropped");
    ctx.check_eq(format_steps(decode_trace("01x1")), "01/1", "separator inside step");
    ctx.check(decode_trace("").empty(), "empty trace has no steps");
    ctx.check(decode_trace("abc").empty(), "trace of separators has no steps");
}

static void test_decode_invalid_length(TestContext& ctx) {
    bool thrown = false;
    try {
        decode_trace("0101");
    } catch (const InvalidTraceLength& e) {
        thrown = true;
        ctx.check_eq(static_cast<long long>(e.length()), 4, "cleaned length reported");
    }
    ctx.check(thrown, "length 4 rejected");

    thrown = false;
    try {
        decode_trace("001_01");
    } catch (const InvalidTraceLength& e) {
        thrown = true;
        ctx.check_eq(static_cast<long long>(e.length()), 5, "separators not counted");
    }
    ctx.check(thrown, "length 5 rejected");
}

// ============================================================================
// Model Tests
// ============================================================================

static void test_builtin_model(TestContext& ctx) {
    TransducerModel model = TransducerModel::builtin();
    ctx.check_eq(static_cast<long long>(model.num_states()), 4, "four predefined states");
    ctx.check_eq(static_cast<long long>(model.transitions().size()), 8, "eight transitions");

    State s0 = *model.find_state("S0");
    State s1 = *model.find_state("S1");
    State s2 = *model.find_state("S2");
    ctx.check_eq(model.name_of(s2), "S2", "name of S2");
    ctx.check(!model.find_state("S4"), "S4 does not exist");

    auto edge = model.lookup(s0, *parse_input("01"));
    ctx.check(edge && edge->to == s1 && edge->output == '1', "S0 --01/1--> S1");
    edge = model.lookup(s0, *parse_input("10"));
    ctx.check(edge && edge->to == s2 && edge->output == '0', "S0 --10/0--> S2");
    ctx.check(!model.lookup(s1, *parse_input("00")), "S1 has no 00 transition");
    ctx.check(!model.lookup(State::synthesized(1), *parse_input("01")),
              "synthesized states have no predefined transitions");
    ctx.check_eq(model.name_of(State::synthesized(3)), "N3", "synthesized name");
}

static void test_parse_model(TestContext& ctx) {
    TransducerModel model = parse_model(kNewStateModel);
    ctx.check_eq(static_cast<long long>(model.num_states()), 2, "two states");
    ctx.check_eq(static_cast<long long>(model.transitions().size()), 7, "seven transitions");
    State a = *model.find_state("A");
    State b = *model.find_state("B");
    ctx.check(a < b, "states ordered by name");
    ctx.check(!model.lookup(a, *parse_input("00")), "A has no 00 transition");
    auto edge = model.lookup(b, *parse_input("00"));
    ctx.check(edge && edge->to == a && edge->output == '0', "B --00/0--> A");
}

static void test_parse_model_errors(TestContext& ctx) {
    ctx.check(model_fails({"S0 01 S1"}, 1), "missing field");
    ctx.check(model_fails({"S0 01 S1 1", "S0 2 S1 1"}, 2), "bad input width");
    ctx.check(model_fails({"S0 0x S1 1"}, 1), "non-binary input");
    ctx.check(model_fails({"# c", "S0 01 S1 2"}, 2), "bad output");
    ctx.check(model_fails({"S0 01 S1 1", "", "S0 01 S2 0"}, 3), "duplicate transition");
    ctx.check(model_fails({"S0 01 N1 1"}, 1), "reserved state name");
    ctx.check(model_fails({"# nothing here", ""}, 0), "empty model");
    ctx.check(!model_fails({"N 01 Nx 1"}, 1), "names merely starting with N are fine");

    bool thrown = false;
    try {
        load_model("/nonexistent/tracefit-model.txt");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    ctx.check(thrown, "missing model file");
}

// ============================================================================
// ExtensionSet Tests
// ============================================================================

static void test_extension_set_persistence(TestContext& ctx) {
    const State s0 = State::predefined(0);
    const State s1 = State::predefined(1);
    const State n1 = State::synthesized(1);

    ExtensionSet empty;
    ExtensionSet one = empty.with(s0, 0, Edge{n1, '1'});
    ExtensionSet two = one.with(n1, 3, Edge{s1, '0'});

    ctx.check(empty.empty() && empty.size() == 0, "base snapshot stays empty");
    ctx.check_eq(static_cast<long long>(one.size()), 1, "one entry");
    ctx.check_eq(static_cast<long long>(two.size()), 2, "two entries");
    ctx.check(!one.contains(n1, 3), "parent unaffected by child");

    auto edge = two.find(s0, 0);
    ctx.check(edge && edge->to == n1 && edge->output == '1', "shared entry visible");
    ctx.check(!two.find(s0, 1), "absent key");

    bool thrown = false;
    try {
        two.with(s0, 0, Edge{s1, '1'});
    } catch (const std::logic_error&) {
        thrown = true;
    }
    ctx.check(thrown, "existing entry cannot be overwritten");

    auto dests = two.destinations();
    ctx.check(dests.size() == 2 && dests[0] == s1 && dests[1] == n1,
              "destinations sorted, predefined first");

    auto entries = two.entries();
    ctx.check(entries.size() == 2 && entries[0].from == s0 && entries[1].from == n1,
              "entries sorted by source");
}

static void test_extension_set_equality(TestContext& ctx) {
    const State s0 = State::predefined(0);
    const State s2 = State::predefined(2);
    const State n1 = State::synthesized(1);

    ExtensionSet a = ExtensionSet{}.with(s0, 0, Edge{s2, '1'}).with(s2, 1, Edge{n1, '0'});
    ExtensionSet b = ExtensionSet{}.with(s2, 1, Edge{n1, '0'}).with(s0, 0, Edge{s2, '1'});
    ExtensionSet c = ExtensionSet{}.with(s0, 0, Edge{s2, '0'}).with(s2, 1, Edge{n1, '0'});

    ctx.check(a == b, "insertion order does not matter");
    ctx.check(a.hash() == b.hash(), "hash is order independent");
    ctx.check(a != c, "different output differs");
    ctx.check(ExtensionSet{} == ExtensionSet{}, "empty sets equal");

    SearchNode k1{2, s2, a, 1};
    SearchNode k2{2, s2, b, 1};
    SearchNode k3{2, s2, b, 0};
    ctx.check(k1 == k2 && SearchNodeHash{}(k1) == SearchNodeHash{}(k2),
              "memo keys compare by value");
    ctx.check(!(k1 == k3), "synthesized count is part of the key");
}

// ============================================================================
// Search Tests
// ============================================================================

static void test_search_empty_trace(TestContext& ctx) {
    TransducerModel model = TransducerModel::builtin();
    auto c = solve_raw(model, "");
    ctx.check(c.has_value(), "empty trace has a completion");
    ctx.check_eq(c->cost, 0, "empty trace costs nothing");
    ctx.check(c->path.empty(), "empty path");
    ctx.check_eq(model.name_of(c->start), "S0", "first start state kept");
}

static void test_search_predefined_only(TestContext& ctx) {
    TransducerModel model = TransducerModel::builtin();
    auto c = solve_raw(model, "011 011 011");
    ctx.check(c.has_value(), "completion exists");
    ctx.check_eq(c->cost, 0, "cycle S0-S1-S3-S0 is free");
    ctx.check_eq(model.name_of(c->start), "S0", "lowest tied start state");
    ctx.check_eq(static_cast<long long>(c->path.size()), 3, "three steps");
    for (const auto& step : c->path) {
        ctx.check(step.kind == StepKind::Predefined, "predefined step");
    }
    ctx.check(c->extensions.empty(), "nothing added");
}

static void test_search_start_state_choice(TestContext& ctx) {
    TransducerModel model = TransducerModel::builtin();
    auto c = solve_raw(model, "001");
    ctx.check_eq(c->cost, 0, "00/1 is predefined from S2");
    ctx.check_eq(model.name_of(c->start), "S2", "start moves to S2");
    ctx.check_eq(format_step(model, c->path[0]), "S2 --(00/1)--> S3", "path step");
}

static void test_search_forced_extra(TestContext& ctx) {
    TransducerModel model = TransducerModel::builtin();
    auto c = solve_raw(model, "000");
    ctx.check_eq(c->cost, 1, "one added transition");
    ctx.check_eq(static_cast<long long>(c->added_transitions), 1, "added count");
    ctx.check_eq(static_cast<long long>(c->synthesized_states), 0, "no new state");
    ctx.check_eq(format_report(model, *c),
                 "Start Node = S0\n"
                 "Extra Cost = 1\n"
                 "Extra Path = 1\n"
                 "Extra Node = 0\n"
                 "Path:\n"
                 "S0 --(00/0)--> S0 (extra)\n",
                 "report for a single extra transition");
}

static void test_search_reuses_extension(TestContext& ctx) {
    TransducerModel model = TransducerModel::builtin();
    auto c = solve_raw(model, "000 000");
    ctx.check_eq(c->cost, 1, "second step reuses the added transition");
    ctx.check(c->path.size() == 2 &&
              c->path[0].kind == StepKind::Extra &&
              c->path[1].kind == StepKind::Reused, "extra then reused");
    ctx.check_eq(static_cast<long long>(c->added_transitions), 1, "reuse is not counted");
}

static void test_search_never_overwrites(TestContext& ctx) {
    // After S0 --00/0--> X, the next 00/1 cannot come from S0 again (the
    // added transition emits 0), so X = S2 with its predefined 00/1 wins.
    TransducerModel model = TransducerModel::builtin();
    auto c = solve_raw(model, "000 001");
    ctx.check_eq(c->cost, 1, "one added transition");
    ctx.check_eq(format_step(model, c->path[0]), "S0 --(00/0)--> S2 (extra)", "added edge");
    ctx.check_eq(format_step(model, c->path[1]), "S2 --(00/1)--> S3", "predefined edge");
}

static void test_search_new_state(TestContext& ctx) {
    TransducerModel model = parse_model(kNewStateModel);
    auto c = solve_raw(model, "001 011");
    ctx.check(c.has_value(), "completion exists");
    ctx.check_eq(format_report(model, *c),
                 "Start Node = A\n"
                 "Extra Cost = 3\n"
                 "Extra Path = 2\n"
                 "Extra Node = 1\n"
                 "Path:\n"
                 "A --(00/1)--> N1 (extra, new node)\n"
                 "N1 --(01/1)--> A (extra)\n",
                 "new state report");

    auto again = solve_raw(model, "001 011 001 011");
    ctx.check_eq(again->cost, 3, "repeating the trace is free");
    ctx.check(again->path.size() == 4 &&
              again->path[0].kind == StepKind::ExtraNewState &&
              again->path[1].kind == StepKind::Extra &&
              again->path[2].kind == StepKind::Reused &&
              again->path[3].kind == StepKind::Reused, "new, extra, reused, reused");
}

static void test_search_no_completion(TestContext& ctx) {
    TransducerModel model = parse_model(kClosedModel);
    SearchEngine engine(model);
    auto c = engine.solve(decode_trace("001"));
    ctx.check(!c.has_value(), "mismatched predefined output closes every start");
    ctx.check_eq(format_no_solution(), "No valid path found.\n", "no-solution text");
    ctx.check(engine.solve(decode_trace("000 010")).has_value(), "matching outputs are fine");
}

static void test_search_demo_traces(TestContext& ctx) {
    TransducerModel model = TransducerModel::builtin();
    for (const auto& trace : demo_traces()) {
        auto steps = decode_trace(trace);
        SearchEngine engine(model);
        auto c = engine.solve(steps);
        ctx.check(c.has_value(), trace + ": completion exists");
        if (!c) continue;
        ctx.check(c->cost >= 0, trace + ": non-negative cost");
        ctx.check_eq(static_cast<long long>(c->path.size()), 8, trace + ": path length");
        ctx.check_eq(c->cost, static_cast<long long>(c->added_transitions + c->synthesized_states),
                     trace + ": cost = transitions + states");
        ctx.check(reproduces(model, *c, steps), trace + ": round trip");

        std::string produced;
        for (const auto& step : c->path) produced += step.output;
        ctx.check_eq(produced, required_outputs(steps), trace + ": path outputs");

        std::string report = format_report(model, *c);
        ctx.check_eq(count_occurrences(report, "(extra"),
                     static_cast<long long>(c->added_transitions),
                     trace + ": extra tags = Extra Path");

        OptimalityChecker checker(model);
        auto optimum = checker.minimum_cost(steps);
        ctx.check(optimum.has_value(), trace + ": Z3 finds an optimum");
        if (optimum) ctx.check_eq(c->cost, *optimum, trace + ": Z3 agrees");
    }
}

static void test_search_idempotent(TestContext& ctx) {
    TransducerModel model = TransducerModel::builtin();
    auto steps = decode_trace(demo_traces()[1]);

    SearchEngine first(model);
    SearchEngine second(model);
    auto a = first.solve(steps);
    auto b = second.solve(steps);
    ctx.check(a && b, "both engines find a completion");
    ctx.check_eq(a->cost, b->cost, "same cost");
    ctx.check(a->start == b->start, "same start state");
    ctx.check(a->path == b->path, "same path");

    // A second trace on the same engine must not see the first trace's memo.
    auto other = decode_trace("000 001");
    auto reused = first.solve(other);
    auto fresh = SearchEngine(model).solve(other);
    ctx.check_eq(reused->cost, fresh->cost, "memo does not leak across calls");
    ctx.check(reused->path == fresh->path, "same path after another trace");
    ctx.check_eq(static_cast<long long>(first.stats().start_states), 4,
                 "stats reset per call");
    ctx.check(first.stats().memo_entries > 0, "memo populated");
}

static void test_search_matches_brute_force(TestContext& ctx) {
    std::mt19937 rng(1337);
    const std::vector<TransducerModel> models = {
        TransducerModel::builtin(),
        parse_model(kNewStateModel),
        parse_model(kClosedModel),
    };

    for (const auto& model : models) {
        for (std::size_t len = 0; len <= 4; ++len) {
            for (int rep = 0; rep < 6; ++rep) {
                std::string trace = random_trace(rng, len);
                auto steps = decode_trace(trace);
                auto c = SearchEngine(model).solve(steps);
                auto expected = brute_force_cost(model, steps);

                ctx.check(c.has_value() == expected.has_value(),
                          trace + ": same feasibility as enumeration");
                if (!c || !expected) continue;
                ctx.check_eq(c->cost, *expected, trace + ": cost matches enumeration");
                ctx.check(reproduces(model, *c, steps), trace + ": round trip");
            }
        }
    }
}

// ============================================================================
// Z3 Tests
// ============================================================================

static void test_z3_small_cases(TestContext& ctx) {
    TransducerModel builtin = TransducerModel::builtin();
    OptimalityChecker checker(builtin);
    ctx.check(checker.minimum_cost({}) == 0, "empty trace");
    ctx.check(checker.minimum_cost(decode_trace("011 011 011")) == 0, "predefined cycle");
    ctx.check(checker.minimum_cost(decode_trace("000 001")) == 1, "one extension");

    TransducerModel fresh = parse_model(kNewStateModel);
    OptimalityChecker fresh_checker(fresh);
    ctx.check(fresh_checker.optimise(decode_trace("001 011")) == Z3Result::SAT, "sat");
    ctx.check_eq(fresh_checker.cost(), 3, "new state is paid for");
    // The last target is free to be A, B or N1 at equal cost.
    ctx.check(fresh_checker.get_model().rfind("A N1 ", 0) == 0, "visited states");

    TransducerModel closed = parse_model(kClosedModel);
    OptimalityChecker closed_checker(closed);
    ctx.check(closed_checker.optimise(decode_trace("001")) == Z3Result::UNSAT,
              "closed model is infeasible");
}

static void test_z3_matches_search(TestContext& ctx) {
    std::mt19937 rng(4242);
    TransducerModel model = TransducerModel::builtin();
    OptimalityChecker checker(model);
    for (int rep = 0; rep < 10; ++rep) {
        std::string trace = random_trace(rng, 3 + rep % 3);
        auto steps = decode_trace(trace);
        auto c = SearchEngine(model).solve(steps);
        auto optimum = checker.minimum_cost(steps);
        ctx.check(c && optimum, trace + ": both solvers succeed");
        if (c && optimum) ctx.check_eq(c->cost, *optimum, trace + ": optimum agrees");
    }
}

// ============================================================================
// Report Tests
// ============================================================================

static void test_completed_transducer(TestContext& ctx) {
    TransducerModel model = parse_model(kNewStateModel);
    auto c = solve_raw(model, "001 011");
    CompletedTransducer machine(model, *c);

    ctx.check_eq(static_cast<long long>(machine.states().size()), 3, "A, B and N1");
    ctx.check(machine.lookup(*model.find_state("A"), 0).has_value(), "added edge present");

    std::string dot = machine.to_dot();
    ctx.check(dot.find("__start -> A;") != std::string::npos, "start arrow");
    ctx.check(dot.find("N1 [shape=box];") != std::string::npos, "synthesized state boxed");
    ctx.check(dot.find("A -> N1 [label=\"00/1\" style=dashed];") != std::string::npos,
              "added edge dashed");
    ctx.check(dot.find("B -> A [label=\"00/0\"];") != std::string::npos, "predefined edge");

    std::string json = machine.to_json();
    ctx.check(json.find("\"start\": \"A\"") != std::string::npos, "json start");
    ctx.check(json.find("{\"name\": \"N1\", \"synthesized\": true}") != std::string::npos,
              "json synthesized state");
    ctx.check_eq(count_occurrences(json, "\"added\": true"), 2, "two added transitions");
    ctx.check_eq(count_occurrences(json, "\"added\": false"), 7, "seven predefined");

    std::string text = machine.to_string();
    ctx.check(text.find("N1 --(01/1)--> A (added)") != std::string::npos, "text listing");
}

static void test_simulate_detects_mismatch(TestContext& ctx) {
    TransducerModel model = TransducerModel::builtin();
    auto c = solve_raw(model, "011 011");
    CompletedTransducer machine(model, *c);
    auto produced = simulate(machine, decode_trace("010 010"));
    ctx.check(produced && *produced == "11", "simulation emits table outputs");
    ctx.check(*produced != required_outputs(decode_trace("010 010")), "mismatch visible");
    ctx.check(!simulate(machine, decode_trace("001")), "undefined step stops simulation");
}

// ============================================================================
// CLI Tests
// ============================================================================

static Options parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    static char program[] = "tracefit";
    argv.push_back(program);
    for (auto& a : args) argv.push_back(a.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

static bool parse_fails(std::vector<std::string> args) {
    try {
        parse(std::move(args));
        return false;
    } catch (const std::exception&) {
        return true;
    }
}

static void test_cli_parse(TestContext& ctx) {
    Options none = parse({});
    ctx.check(none.input.empty() && !none.selftest, "no arguments: demo mode");

    Options opts = parse({"--verify", "--stats", "--dot", "--json", "-j", "3",
                          "--model", "m.txt", "001_010"});
    ctx.check(opts.verify && opts.show_stats && opts.show_dot && opts.show_json, "flags");
    ctx.check_eq(opts.num_threads, 3, "thread count");
    ctx.check_eq(opts.model_path, "m.txt", "model path");
    ctx.check_eq(opts.input, "001_010", "trace argument");

    ctx.check(parse({"--selftest"}).selftest, "--selftest");
    ctx.check(parse({"-h"}).help, "-h");
    ctx.check(parse_fails({"--bogus"}), "unknown option");
    ctx.check(parse_fails({"--model"}), "--model without file");
    ctx.check(parse_fails({"--threads", "-1"}), "negative thread count");
    ctx.check(parse_fails({"001", "010"}), "two inputs");
}

// ============================================================================
// run_selftests
// ============================================================================

int run_selftests() {
    TestRunner runner;

    // Decoding
    runner.run("input_symbols",             test_input_symbols);
    runner.run("decode_demo_trace",         test_decode_demo_trace);
    runner.run("decode_separators",         test_decode_separators);
    runner.run("decode_invalid_length",     test_decode_invalid_length);

    // Model
    runner.run("builtin_model",             test_builtin_model);
    runner.run("parse_model",               test_parse_model);
    runner.run("parse_model_errors",        test_parse_model_errors);

    // Extension sets
    runner.run("extension_set_persistence", test_extension_set_persistence);
    runner.run("extension_set_equality",    test_extension_set_equality);

    // Search
    runner.run("search_empty_trace",        test_search_empty_trace);
    runner.run("search_predefined_only",    test_search_predefined_only);
    runner.run("search_start_state_choice", test_search_start_state_choice);
    runner.run("search_forced_extra",       test_search_forced_extra);
    runner.run("search_reuses_extension",   test_search_reuses_extension);
    runner.run("search_never_overwrites",   test_search_never_overwrites);
    runner.run("search_new_state",          test_search_new_state);
    runner.run("search_no_completion",      test_search_no_completion);
    runner.run("search_demo_traces",        test_search_demo_traces);
    runner.run("search_idempotent",         test_search_idempotent);
    runner.run("search_matches_brute_force", test_search_matches_brute_force);

    // Z3
    runner.run("z3_small_cases",            test_z3_small_cases);
    runner.run("z3_matches_search",         test_z3_matches_search);

    // Report
    runner.run("completed_transducer",      test_completed_transducer);
    runner.run("simulate_detects_mismatch", test_simulate_detects_mismatch);

    // CLI
    runner.run("cli_parse",                 test_cli_parse);

    return runner.summarise();
}

}  // namespace tracefit
