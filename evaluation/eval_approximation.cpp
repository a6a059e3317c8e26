/**
 * Approximation quality of hash-based linear layers.
 *
 * Part 1: Monte Carlo convergence of the cosine estimate vs code width k.
 * Part 2: Patch fidelity of a small MLP (relative error vs exact output,
 *         forward latency, weight-code cache behavior).
 */

#include "../include/hashmv/hashmv.hpp"
#include "utils/common.hpp"
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <vector>

using namespace hashmv;
using namespace hashmv::eval;

std::vector<Float> random_vector(size_t dim, std::mt19937_64& rng) {
    std::normal_distribution<Float> dist(0.0f, 1.0f);
    std::vector<Float> v(dim);
    for (auto& x : v) x = dist(rng);
    return v;
}

/// b = cos(theta) a + sin(theta) t, with t orthogonal to a, both unit norm
std::vector<Float> vector_at_angle(const std::vector<Float>& a, double theta,
                                   std::mt19937_64& rng) {
    std::vector<Float> t = random_vector(a.size(), rng);
    Float proj = dot(t.data(), a.data(), a.size());
    for (size_t i = 0; i < a.size(); ++i) t[i] -= proj * a[i];
    t = normalize(t);

    std::vector<Float> b(a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        b[i] = static_cast<Float>(std::cos(theta)) * a[i] + static_cast<Float>(std::sin(theta)) * t[i];
    }
    return b;
}

void run_convergence(size_t dim, size_t trials) {
    std::cout << "=== Part 1: Cosine estimate vs code width ===\n";
    std::cout << "dim = " << dim << ", trials = " << trials << "\n\n";
    std::cout << std::setw(8) << "k" << std::setw(12) << "MAE" << std::setw(12) << "StdDev"
              << std::setw(12) << "Pearson" << std::setw(12) << "Time(ms)" << "\n";
    std::cout << std::string(56, '-') << "\n";

    std::uniform_real_distribution<double> angle(0.0, 3.14159265358979);

    for (size_t k : {8, 32, 128, 512, 2048}) {
        std::mt19937_64 rng(1234);
        std::vector<double> errors, estimates, exact;
        Timer timer;
        timer.start();

        for (size_t t = 0; t < trials; ++t) {
            std::vector<Float> a = normalize(random_vector(dim, rng));
            std::vector<Float> b = vector_at_angle(a, angle(rng), rng);
            RandomProjection proj(k, dim, rng());

            Float s = similarity(SignHasher::hash_vector(a, proj.matrix()),
                                 SignHasher::hash_vector(b, proj.matrix()));
            double est = SimilarityReconstructor::cosine(s);
            double truth = dot(a.data(), b.data(), dim);

            errors.push_back(std::abs(est - truth));
            estimates.push_back(est);
            exact.push_back(truth);
        }

        std::cout << std::setw(8) << k
                  << std::setw(12) << format_number(compute_mean(errors), 4)
                  << std::setw(12) << format_number(compute_stddev(errors), 4)
                  << std::setw(12) << format_number(compute_pearson_correlation(estimates, exact), 4)
                  << std::setw(12) << format_number(timer.elapsed_ms(), 1) << "\n";
    }
    std::cout << "\n";
}

std::unique_ptr<Sequential> make_mlp(size_t in_dim, size_t hidden, size_t out_dim) {
    auto model = std::make_unique<Sequential>();
    model->add("fc1", std::make_unique<Linear>(in_dim, hidden, true, 1))
          .add("act1", std::make_unique<ReLU>())
          .add("fc2", std::make_unique<Linear>(hidden, hidden, true, 2))
          .add("act2", std::make_unique<ReLU>())
          .add("head", std::make_unique<Linear>(hidden, out_dim, true, 3));
    return model;
}

double relative_error(const Matrix& approx, const Matrix& exact) {
    double err = 0.0, ref = 0.0;
    for (size_t i = 0; i < exact.size(); ++i) {
        double d = approx.data()[i] - exact.data()[i];
        err += d * d;
        ref += static_cast<double>(exact.data()[i]) * exact.data()[i];
    }
    return ref > 0.0 ? std::sqrt(err / ref) : 0.0;
}

void run_patch_fidelity(size_t batch, size_t in_dim, size_t hidden, size_t out_dim, size_t repeats) {
    std::cout << "=== Part 2: Patched MLP fidelity ===\n";
    std::cout << "MLP " << in_dim << " -> " << hidden << " -> " << hidden << " -> " << out_dim
              << ", batch = " << batch << ", repeats = " << repeats << "\n\n";

    auto model = make_mlp(in_dim, hidden, out_dim);
    model->eval();

    std::mt19937_64 rng(99);
    std::normal_distribution<Float> dist(0.0f, 1.0f);
    Matrix x(batch, in_dim);
    for (size_t i = 0; i < x.size(); ++i) x.data()[i] = dist(rng);

    Timer timer;
    timer.start();
    Matrix exact;
    for (size_t r = 0; r < repeats; ++r) exact = model->forward(x);
    double exact_ms = timer.elapsed_ms() / static_cast<double>(repeats);
    std::cout << "Exact forward: " << format_number(exact_ms, 3) << " ms\n\n";

    std::cout << std::setw(14) << "Variant" << std::setw(8) << "k" << std::setw(12) << "RelErr"
              << std::setw(12) << "Fwd(ms)" << std::setw(10) << "Builds" << std::setw(10) << "Reuses"
              << "\n";
    std::cout << std::string(66, '-') << "\n";

    for (KernelVariant variant : {KernelVariant::RandomProj, KernelVariant::LearnedProj}) {
        for (size_t k : {64, 256, 1024}) {
            auto patched = patch_model(*model, KernelConfig().set_variant(variant).set_k(k));

            timer.start();
            Matrix approx;
            for (size_t r = 0; r < repeats; ++r) approx = patched->forward(x);
            double hash_ms = timer.elapsed_ms() / static_cast<double>(repeats);

            uint64_t builds = 0, reuses = 0;
            walk(*patched, [&](Layer& layer, const std::string&) {
                if (auto* kernel = dynamic_cast<HashKernel*>(&layer)) {
                    builds += kernel->stats().weight_code_builds;
                    reuses += kernel->stats().weight_code_reuses;
                }
            });

            std::cout << std::setw(14) << variant_name(variant) << std::setw(8) << k
                      << std::setw(12) << format_number(relative_error(approx, exact), 4)
                      << std::setw(12) << format_number(hash_ms, 3)
                      << std::setw(10) << builds << std::setw(10) << reuses << "\n";
        }
    }
    std::cout << "\n";
}

int main(int argc, char** argv) {
    std::cout << "hashmv Approximation Evaluation\n";
    std::cout << "===============================\n\n";
    print_system_info();

    size_t trials = 500;
    size_t repeats = 10;
    if (argc > 1) trials = std::strtoul(argv[1], nullptr, 10);
    if (argc > 2) repeats = std::strtoul(argv[2], nullptr, 10);

    try {
        run_convergence(128, trials);
        run_patch_fidelity(64, 256, 512, 32, repeats);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
