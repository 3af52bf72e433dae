/**
 * Policy check example for verdict
 *
 * This example demonstrates:
 * - Building a constraint set
 * - Compiling it through the evaluator cache
 * - Reading satisfied / open / conflict residuals
 * - Registering a custom operator and the resulting fallback path
 */

#include <verdict/cache/evaluator_cache.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace verdict;

static void report(const std::string& label, const residual& r) {
    std::cout << "  " << label << " -> " << to_string(r) << "\n";
}

int main() {
    auto config = cache::cache_config::from_env();
    if (!config) {
        std::cerr << "Configuration error: " << config.error().message << std::endl;
        return 1;
    }
    config->mode = analysis::analysis_mode::quantified;

    operator_registry registry;
    cache::evaluator_cache cache(registry, *config);

    constraint_set policy;
    policy.add(path{"role"}, {constraint::in({"admin", "ops"})})
          .add(path::parse("user.age"), {constraint::gte(18)})
          .add(quantifier::forall(path{"items"}, {{path{"qty"}, constraint::lte(5)}}));

    std::cout << "=== Compiled policy ===" << std::endl;
    auto evaluator = cache.get_or_compile(policy);
    if (!evaluator) {
        std::cerr << "Compilation failed: " << evaluator.error().message << std::endl;
        return 1;
    }

    const auto item = [](int qty) { return value::object({{"qty", qty}}); };

    report("complete", (**evaluator)(value::object({
        {"role", "ops"},
        {"user", value::object({{"age", 30}})},
        {"items", value::list({item(1), item(2)})},
    })));
    report("missing age", (**evaluator)(value::object({{"role", "admin"}})));
    report("guest", (**evaluator)(value::object({{"role", "guest"}})));
    report("oversized item", (**evaluator)(value::object({
        {"role", "admin"},
        {"user", value::object({{"age", 40}})},
        {"items", value::list({item(3), item(9)})},
    })));

    std::cout << "\n=== Custom operator ===" << std::endl;
    auto version = registry.register_operator("prefix", [](const value& v, const operand& o) {
        if (v.type() != value::kind::string) return false;
        const auto& s = std::get<std::string>(v.as_scalar());
        const auto& p = std::get<std::string>(std::get<scalar>(o));
        return s.rfind(p, 0) == 0;
    });
    if (!version) {
        std::cerr << "Registration failed: " << version.error().message << std::endl;
        return 1;
    }
    std::cout << "  registry version " << *version << std::endl;

    constraint_set custom;
    custom.add(path{"team"}, {constraint{"prefix", scalar{std::string("infra-")}}});
    auto rejected = cache.get_or_compile(custom);
    if (!rejected) {
        std::cout << "  " << core::to_string(rejected.error().code) << ": "
                  << rejected.error().message << std::endl;
        const auto& rule = custom.find(path{"team"})->constraints.front();
        auto holds = registry.evaluate_custom(rule.op, value{"infra-db"}, rule.value);
        if (holds) std::cout << "  interpreter says: " << (*holds ? "holds" : "fails") << std::endl;
    }

    const auto stats = cache.stats();
    std::cout << "\n=== Cache ===" << std::endl;
    std::cout << "  hits=" << stats.hits << " misses=" << stats.misses
              << " size=" << stats.size << " hit_rate=" << stats.hit_rate << std::endl;
    return 0;
}
