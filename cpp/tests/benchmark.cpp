#include <chrono>
#include <iostream>
#include <vector>

#include "ApplyOperator.h"
#include "Distribution.h"
#include "Experiment.h"
#include "Parameter.h"
#include "ParameterCompiler.h"

using namespace ensemble;

int main() {
    // --- 1) Define parameters ---
    std::vector<Parameter> params = {
        Parameter("elasticity", Distribution::uniform(0.2, 1.5)),
        Parameter("growth", Distribution::normal(0.02, 0.005)),
        Parameter("capex", Distribution::triangle(0.8, 1.0, 1.4)),
        Parameter("efficiency", Distribution::lognormal(0.0, 0.2)),
        Parameter("adoption", Distribution::logUniform(0.1, 10.0)),
        Parameter("discount", Distribution::sequence({0.03, 0.05, 0.07})),
        Parameter("capexFollow", Distribution::linked("capex")),
    };
    params[2].apply = "multiply";
    params[2].baseValue = 1200.0;
    params[3].mode = DrawMode::Independent;
    params[0].correlations.push_back({"growth", 0.6});
    params[1].correlations.push_back({"capex", -0.3});

    // --- 2) Experiments ---
    std::vector<Experiment> experiments(4);
    experiments[0].name = "base";
    experiments[0].role = ExperimentRole::Baseline;
    for (int i = 1; i < 4; ++i) experiments[i].name = "policy" + std::to_string(i);

    // --- 3) Compile ---
    const int trials = 100'000;
    ApplyRegistry registry;
    auto start = std::chrono::high_resolution_clock::now();

    ParameterCompiler compiler(params, registry, 420, "lhs");
    const auto values = compiler.compile(trials, experiments);

    auto stop = std::chrono::high_resolution_clock::now();
    auto runtime = std::chrono::duration<double>(stop - start).count();
    std::cout << "Runtime: " << runtime << " seconds" << std::endl;
    std::cout << "Input values: " << values.size() << " (" << trials << " trials, "
              << compiler.order().size() << " parameters)" << std::endl;
    return 0;
}
