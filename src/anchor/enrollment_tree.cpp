// ANCHORZK - Enrollment Tree Implementation
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/anchor/enrollment_tree.h"
#include "anchorzk/anchor/field_split.h"
#include "anchorzk/crypto/poseidon.h"
#include "anchorzk/util/logging.h"
#include "anchorzk/util/threadpool.h"

#include <algorithm>
#include <future>
#include <string>
#include <vector>

namespace anchorzk {
namespace anchor {

std::optional<Hash256> ComputeLeafHash(const bn254::Point& anchor, const bn254::Point& link) {
    auto anchorX = SplitPointX(anchor);
    auto linkX = SplitPointX(link);
    if (!anchorX || !linkX) {
        return std::nullopt;
    }

    FieldElement digest = PoseidonHash({FieldElement(kLeafDomainTag),
                                        (*anchorX)[0], (*anchorX)[1],
                                        (*linkX)[0], (*linkX)[1]});
    return Hash256(digest.ToBytes());
}

EnrollmentTree::EnrollmentTree(uint32_t range, bn254::Point anchor, merkle::MerkleTree tree)
    : range_(range), anchor_(std::move(anchor)), tree_(std::move(tree)) {}

namespace {

bool IsCancelled(const TreeBuildOptions& options) {
    return options.cancel && options.cancel->load(std::memory_order_relaxed);
}

/// Fill leaves[begin, end) for witnesses begin+1 .. end
AnchorError ComputeChunk(uint64_t begin, uint64_t end,
                         const bn254::Point& anchor,
                         const Scalar& secret,
                         const bn254::Point& step,
                         const TreeBuildOptions& options,
                         std::vector<Hash256>& leaves) {
    bn254::Point link = bn254::Point::MulGenerator(secret * Scalar(begin + 1));
    for (uint64_t i = begin; i < end; ++i) {
        if (IsCancelled(options)) {
            return AnchorError::Cancelled;
        }
        auto leaf = ComputeLeafHash(anchor, link);
        if (!leaf) {
            return AnchorError::InvalidInput;
        }
        leaves[i] = *leaf;
        link = link + step;
    }
    return AnchorError::None;
}

} // anonymous namespace

TreeBuildResult BuildEnrollmentTree(uint32_t range,
                                    const bn254::Point& anchor,
                                    const Scalar& secret,
                                    const TreeBuildOptions& options) {
    TreeBuildResult result;

    if (range < 1 || range > kMaxRange) {
        LOG_WARN(util::LogCategory::TREE) << "Range " << range << " outside [1, " << kMaxRange << "]";
        result.error = AnchorError::RangeMismatch;
        return result;
    }
    if (secret.IsZero() || anchor.IsIdentity()) {
        LOG_WARN(util::LogCategory::TREE) << "Tree build rejected: zero secret or identity anchor";
        result.error = AnchorError::InvalidInput;
        return result;
    }

    const uint64_t total = uint64_t{1} << range;
    util::ScopedLogTimer timer(util::LogCategory::TREE,
                               "enrollment tree, " + std::to_string(total) + " leaves");

    std::vector<Hash256> leaves(total);
    const bn254::Point step = bn254::Point::MulGenerator(secret);

    AnchorError error = AnchorError::None;
    uint64_t done = 0;

    if (options.threads == 0) {
        for (uint64_t begin = 0; begin < total && error == AnchorError::None; begin += kTreeChunkSize) {
            uint64_t end = std::min(total, begin + kTreeChunkSize);
            error = ComputeChunk(begin, end, anchor, secret, step, options, leaves);
            if (error == AnchorError::None) {
                done = end;
                if (options.progress) options.progress(done, total);
            }
        }
    } else {
        util::ThreadPool pool(options.threads);
        std::vector<std::future<AnchorError>> futures;
        std::vector<uint64_t> ends;
        for (uint64_t begin = 0; begin < total; begin += kTreeChunkSize) {
            uint64_t end = std::min(total, begin + kTreeChunkSize);
            futures.push_back(pool.Submit([begin, end, &anchor, &secret, &step, &options, &leaves]() {
                return ComputeChunk(begin, end, anchor, secret, step, options, leaves);
            }));
            ends.push_back(end);
        }

        // Barrier: every chunk is collected before assembly
        for (size_t i = 0; i < futures.size(); ++i) {
            AnchorError chunkError = futures[i].get();
            if (chunkError != AnchorError::None) {
                if (error == AnchorError::None) error = chunkError;
                continue;
            }
            done += ends[i] - (i == 0 ? 0 : ends[i - 1]);
            if (error == AnchorError::None && options.progress) {
                options.progress(done, total);
            }
        }
    }

    if (error != AnchorError::None) {
        LOG_WARN(util::LogCategory::TREE) << "Tree build stopped: " << AnchorErrorToString(error);
        result.error = error;
        return result;
    }

    auto tree = merkle::MerkleTree::FromLeaves(std::move(leaves),
                                               std::make_shared<merkle::PoseidonMerkleHasher>());
    result.tree = std::make_shared<const EnrollmentTree>(range, anchor, std::move(tree));
    LOG_DEBUG(util::LogCategory::TREE) << "Enrollment tree root " << result.tree->Root().ToHex();
    return result;
}

} // namespace anchor
} // namespace anchorzk
