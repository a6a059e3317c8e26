#pragma once

/**
 * hashmv: Hash-based approximation of linear layers.
 *
 * Replaces y = x W^T + b with k-bit random hyperplane codes of x and of
 * each row of W, reconstructing every dot product from Hamming agreement
 * and the retained vector norms.
 *
 * TYPICAL USAGE:
 *
 *   auto model = load_backbone();                     // Sequential of Linear/ReLU
 *   auto hashed = patch_model(*model, KernelConfig()
 *                                 .set_variant(KernelVariant::LearnedProj)
 *                                 .set_k(128));
 *   hashed->eval();
 *   Matrix y = hashed->forward(x);
 */

#include "api/config.hpp"
#include "autograd/straight_through.hpp"
#include "core/codes.hpp"
#include "core/debug.hpp"
#include "core/errors.hpp"
#include "core/matrix.hpp"
#include "core/parameter.hpp"
#include "core/types.hpp"
#include "distance/hamming.hpp"
#include "distance/similarity.hpp"
#include "encoder/normalizer.hpp"
#include "encoder/projection.hpp"
#include "encoder/sign_hasher.hpp"
#include "nn/activation.hpp"
#include "nn/checkpoint.hpp"
#include "nn/hash_kernel.hpp"
#include "nn/layer.hpp"
#include "nn/linear.hpp"
#include "nn/loss.hpp"
#include "nn/model_patcher.hpp"
#include "nn/sequential.hpp"
#include "nn/sgd.hpp"
