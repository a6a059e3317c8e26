#pragma once

#include "../core/debug.hpp"
#include "../core/errors.hpp"
#include "../core/matrix.hpp"
#include "layer.hpp"
#include <algorithm>
#include <bit>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <limits>
#include <istream>
#include <map>
#include <ostream>
#include <string>

namespace hashmv {

/// Parameter values keyed by dotted path ("fc1.weight", "fc1.projection")
using StateDict = std::map<std::string, Matrix>;

// ============================================================================
// State Dict
// ============================================================================

/**
 * Snapshot every parameter of the tree, frozen projections included.
 */
inline StateDict state_dict(Layer& root) {
    StateDict state;
    for (auto& [name, param] : named_parameters(root)) {
        state.emplace(name, param->value());
    }
    return state;
}

/**
 * Write `state` into the tree's parameters.
 *
 * Every parameter must be present with its current shape. With `strict`,
 * keys that name no parameter are an error too. Each layer then checks the
 * values it would receive (Layer::validate_state); only when the whole tree
 * accepts them is anything assigned, so a rejected load changes nothing.
 * Each layer gets on_state_loaded() afterwards so derived caches are rebuilt.
 *
 * @throws CheckpointError on missing/unexpected keys or shape mismatch
 * @throws DegenerateVectorError if a layer rejects a value (e.g. zero
 *         projection row)
 */
inline void load_state_dict(Layer& root, const StateDict& state, bool strict = true) {
    auto params = named_parameters(root);

    // Validate everything before touching any parameter
    for (auto& [name, param] : params) {
        auto it = state.find(name);
        if (it == state.end()) {
            throw CheckpointError("checkpoint is missing '" + name + "'");
        }
        if (!it->second.same_shape(param->value())) {
            throw CheckpointError("checkpoint entry '" + name + "' has shape " +
                                  it->second.shape_string() + ", expected " +
                                  param->value().shape_string());
        }
    }
    if (strict && state.size() != params.size()) {
        for (const auto& [key, value] : state) {
            bool known = false;
            for (auto& [name, param] : params) {
                if (name == key) { known = true; break; }
            }
            if (!known) {
                throw CheckpointError("checkpoint entry '" + key + "' matches no parameter");
            }
        }
    }

    walk(root, [&](Layer& layer, const std::string& path) {
        LocalState incoming;
        for (auto& [local, param] : layer.local_parameters()) {
            incoming.emplace(local, &state.at(detail::join_path(path, local)));
        }
        layer.validate_state(incoming);
    });

    for (auto& [name, param] : params) {
        param->assign(state.at(name));
    }
    walk(root, [](Layer& layer, const std::string&) { layer.on_state_loaded(); });
}

// ============================================================================
// Binary Format
// ============================================================================

/**
 * Checkpoint layout (all integers and floats little-endian):
 *
 *   magic   "HMVC" (4 bytes)
 *   version uint32
 *   count   uint64
 *   count x { name_len uint32, name bytes, rows uint64, cols uint64,
 *             rows * cols float32 }
 *
 * Entries are written in key order, so equal states produce equal files.
 */
inline constexpr char CHECKPOINT_MAGIC[4] = {'H', 'M', 'V', 'C'};
inline constexpr uint32_t CHECKPOINT_VERSION = 1;

/// Longest parameter path a checkpoint entry may carry
inline constexpr uint32_t CHECKPOINT_MAX_NAME = 4096;

namespace detail {

static_assert(sizeof(Float) == sizeof(uint32_t), "checkpoint stores float32");

template <typename U>
inline void write_le(std::ostream& out, U value) {
    char bytes[sizeof(U)];
    for (size_t i = 0; i < sizeof(U); ++i) {
        bytes[i] = static_cast<char>((value >> (8 * i)) & 0xFF);
    }
    out.write(bytes, sizeof(U));
}

template <typename U>
inline U read_le(std::istream& in, const char* what) {
    unsigned char bytes[sizeof(U)];
    in.read(reinterpret_cast<char*>(bytes), sizeof(U));
    if (!in) {
        throw CheckpointError(std::string("truncated checkpoint while reading ") + what);
    }
    U value = 0;
    for (size_t i = 0; i < sizeof(U); ++i) {
        value |= static_cast<U>(bytes[i]) << (8 * i);
    }
    return value;
}

inline void write_floats(std::ostream& out, const Float* data, size_t n) {
    if constexpr (std::endian::native == std::endian::little) {
        out.write(reinterpret_cast<const char*>(data),
                  static_cast<std::streamsize>(n * sizeof(Float)));
    } else {
        for (size_t i = 0; i < n; ++i) {
            write_le(out, std::bit_cast<uint32_t>(data[i]));
        }
    }
}

inline void read_floats(std::istream& in, Float* data, size_t n, const std::string& name) {
    if constexpr (std::endian::native == std::endian::little) {
        in.read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(n * sizeof(Float)));
        if (!in) {
            throw CheckpointError("truncated checkpoint while reading '" + name + "'");
        }
    } else {
        for (size_t i = 0; i < n; ++i) {
            data[i] = std::bit_cast<Float>(read_le<uint32_t>(in, name.c_str()));
        }
    }
}

/**
 * Bytes left between the read position and the end of a seekable stream,
 * or max() when the stream cannot report it.
 */
inline uint64_t bytes_remaining(std::istream& in) {
    const std::streamoff here = in.tellg();
    if (here < 0) {
        return std::numeric_limits<uint64_t>::max();
    }
    in.seekg(0, std::ios::end);
    const std::streamoff end = in.tellg();
    in.clear();
    in.seekg(here);
    if (end < here) {
        return std::numeric_limits<uint64_t>::max();
    }
    return static_cast<uint64_t>(end - here);
}

}  // namespace detail

inline void write_state_dict(std::ostream& out, const StateDict& state) {
    out.write(CHECKPOINT_MAGIC, sizeof(CHECKPOINT_MAGIC));
    detail::write_le(out, CHECKPOINT_VERSION);
    detail::write_le(out, static_cast<uint64_t>(state.size()));

    for (const auto& [name, m] : state) {
        if (name.size() > CHECKPOINT_MAX_NAME) {
            throw CheckpointError("parameter name too long for checkpoint: " + name);
        }
        detail::write_le(out, static_cast<uint32_t>(name.size()));
        out.write(name.data(), static_cast<std::streamsize>(name.size()));
        detail::write_le(out, static_cast<uint64_t>(m.rows()));
        detail::write_le(out, static_cast<uint64_t>(m.cols()));
        detail::write_floats(out, m.data(), m.size());
    }
    if (!out) {
        throw CheckpointError("failed to write checkpoint");
    }
}

/**
 * Parse a checkpoint stream. Header fields are checked against the data
 * actually left in the stream before anything is allocated, so a corrupt
 * file fails with CheckpointError rather than an allocation failure.
 */
inline StateDict read_state_dict(std::istream& in) {
    char magic[4];
    in.read(magic, sizeof(magic));
    if (!in || std::memcmp(magic, CHECKPOINT_MAGIC, sizeof(magic)) != 0) {
        throw CheckpointError("not a hashmv checkpoint (bad magic)");
    }
    const auto version = detail::read_le<uint32_t>(in, "version");
    if (version != CHECKPOINT_VERSION) {
        throw CheckpointError("unsupported checkpoint version " + std::to_string(version));
    }

    const auto count = detail::read_le<uint64_t>(in, "entry count");
    StateDict state;
    for (uint64_t e = 0; e < count; ++e) {
        const auto name_len = detail::read_le<uint32_t>(in, "name length");
        if (name_len > CHECKPOINT_MAX_NAME || name_len > detail::bytes_remaining(in)) {
            throw CheckpointError("corrupt checkpoint: entry name length " +
                                  std::to_string(name_len));
        }
        std::string name(name_len, '\0');
        in.read(name.data(), name_len);
        if (!in) {
            throw CheckpointError("truncated checkpoint while reading entry name");
        }

        const auto rows = detail::read_le<uint64_t>(in, "rows");
        const auto cols = detail::read_le<uint64_t>(in, "cols");
        const uint64_t max_elems = std::min<uint64_t>(
            std::numeric_limits<size_t>::max() / sizeof(Float),
            detail::bytes_remaining(in) / sizeof(Float));
        if (cols != 0 && rows > max_elems / cols) {
            throw CheckpointError("corrupt checkpoint: entry '" + name + "' claims shape (" +
                                  std::to_string(rows) + ", " + std::to_string(cols) +
                                  ") beyond the data present");
        }

        Matrix m(static_cast<size_t>(rows), static_cast<size_t>(cols));
        detail::read_floats(in, m.data(), m.size(), name);
        if (!state.emplace(std::move(name), std::move(m)).second) {
            throw CheckpointError("duplicate checkpoint entry");
        }
    }
    return state;
}

/**
 * Save all parameters of `root` to `path`.
 */
inline void save_checkpoint(Layer& root, const std::string& path) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw CheckpointError("Cannot open file for writing: " + path);
    }
    StateDict state = state_dict(root);
    write_state_dict(file, state);
    HASHMV_DEBUG("saved " << state.size() << " tensors to " << path);
}

/**
 * Load parameters saved by save_checkpoint into a tree of the same structure.
 */
inline void load_checkpoint(Layer& root, const std::string& path, bool strict = true) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw CheckpointError("Cannot open file: " + path);
    }
    StateDict state = read_state_dict(file);
    load_state_dict(root, state, strict);
    HASHMV_DEBUG("loaded " << state.size() << " tensors from " << path);
}

}  // namespace hashmv
