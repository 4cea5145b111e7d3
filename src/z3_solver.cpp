// ============================================================================
// z3_solver.cpp — Z3 optimisation encoding of trace completion
// ============================================================================

#include "tracefit/z3_solver.hpp"

#include <map>
#include <string>

namespace tracefit {

const char* z3_result_name(Z3Result r) noexcept {
    switch (r) {
        case Z3Result::SAT:     return "SAT";
        case Z3Result::UNSAT:   return "UNSAT";
        case Z3Result::UNKNOWN: return "UNKNOWN";
    }
    return "?";
}

// ── OptimalityChecker ───────────────────────────────────────────────────────

OptimalityChecker::OptimalityChecker(const TransducerModel& model)
    : model_(model), ctx_() {}

Z3Result OptimalityChecker::optimise(const std::vector<Step>& steps) {
    cost_ = 0;
    visited_.clear();

    const int num_predefined = static_cast<int>(model_.num_states());
    const int n = static_cast<int>(steps.size());
    const int universe = num_predefined + n;

    z3::optimize opt(ctx_);

    // Visited states s_0 … s_n.
    std::vector<z3::expr> s;
    for (int i = 0; i <= n; ++i) {
        std::string name = "s_" + std::to_string(i);
        s.push_back(ctx_.int_const(name.c_str()));
        opt.add(s.back() >= 0);
        opt.add(s.back() < universe);
    }
    opt.add(s[0] < num_predefined);

    // Completed machine: one destination and one output function per input.
    std::vector<z3::func_decl> dest;
    std::vector<z3::func_decl> out;
    for (InputSymbol a = 0; a < kInputAlphabetSize; ++a) {
        std::string dname = "dest_" + input_to_string(a);
        std::string oname = "out_" + input_to_string(a);
        dest.push_back(ctx_.function(dname.c_str(), ctx_.int_sort(), ctx_.int_sort()));
        out.push_back(ctx_.function(oname.c_str(), ctx_.int_sort(), ctx_.bool_sort()));
    }
    for (const auto& t : model_.transitions()) {
        z3::expr from = ctx_.int_val(static_cast<int>(t.from.index));
        opt.add(dest[t.input](from) == ctx_.int_val(static_cast<int>(t.to.index)));
        opt.add(out[t.input](from) == ctx_.bool_val(t.output == '1'));
    }

    // The path reproduces the trace.
    for (int i = 0; i < n; ++i) {
        const Step& step = steps[i];
        opt.add(dest[step.input](s[i]) == s[i + 1]);
        opt.add(out[step.input](s[i]) == ctx_.bool_val(step.output == '1'));
    }

    // Objective.
    z3::expr one  = ctx_.int_val(1);
    z3::expr zero = ctx_.int_val(0);
    z3::expr total = ctx_.int_val(0);

    for (int q = 0; q < universe; ++q) {
        for (InputSymbol a = 0; a < kInputAlphabetSize; ++a) {
            if (q < num_predefined &&
                model_.lookup(State::predefined(static_cast<std::uint32_t>(q)), a)) {
                continue;
            }
            z3::expr_vector uses(ctx_);
            for (int i = 0; i < n; ++i) {
                if (steps[i].input == a) uses.push_back(s[i] == q);
            }
            if (uses.size() == 0) continue;
            total = total + z3::ite(z3::mk_or(uses), one, zero);
        }
    }
    for (int q = num_predefined; q < universe; ++q) {
        z3::expr_vector visits(ctx_);
        for (int i = 1; i <= n; ++i) visits.push_back(s[i] == q);
        total = total + z3::ite(z3::mk_or(visits), one, zero);
    }

    opt.minimize(total);

    switch (opt.check()) {
        case z3::unsat:   return Z3Result::UNSAT;
        case z3::unknown: return Z3Result::UNKNOWN;
        case z3::sat:     break;
    }

    z3::model m = opt.get_model();
    cost_ = m.eval(total, true).get_numeral_int();

    std::map<int, int> synthesized_tag;
    for (int i = 0; i <= n; ++i) {
        int q = m.eval(s[i], true).get_numeral_int();
        if (!visited_.empty()) visited_ += ' ';
        if (q < num_predefined) {
            visited_ += model_.name_of(State::predefined(static_cast<std::uint32_t>(q)));
        } else {
            auto it = synthesized_tag.find(q);
            if (it == synthesized_tag.end()) {
                it = synthesized_tag.emplace(q, static_cast<int>(synthesized_tag.size()) + 1).first;
            }
            visited_ += "N" + std::to_string(it->second);
        }
    }
    return Z3Result::SAT;
}

std::optional<int> OptimalityChecker::minimum_cost(const std::vector<Step>& steps) {
    if (optimise(steps) != Z3Result::SAT) return std::nullopt;
    return cost_;
}

}  // namespace tracefit
