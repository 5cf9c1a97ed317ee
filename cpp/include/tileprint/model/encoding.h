#ifndef TILEPRINT_MODEL_ENCODING_H
#define TILEPRINT_MODEL_ENCODING_H

#include <tileprint/util/string_utils.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace tileprint {

/**
 * Static description of how a tile is spread over threads
 * (`tile_distribution_encoding<RsLengths, HsLengthss, Ps2RHssMajor, Ps2RHssMinor,
 * Ys2RHsMajor, Ys2RHsMinor>`). Major index 0 selects the replicated R dimensions,
 * major k > 0 selects the hidden H dimensions of X dimension k - 1.
 */
struct DistributionEncoding {
    IntList rs_lengths;
    std::vector<IntList> hs_lengthss;
    std::vector<IntList> ps_to_rhss_major;
    std::vector<IntList> ps_to_rhss_minor;
    IntList ys_to_rhs_major;
    IntList ys_to_rhs_minor;

    /** Length of the R or H dimension addressed by (major, minor), if it exists. */
    [[nodiscard]] std::optional<std::int64_t> rh_length(std::int64_t major, std::int64_t minor) const {
        if (minor < 0) return std::nullopt;
        const auto m = static_cast<std::size_t>(minor);
        if (major == 0) {
            if (m < rs_lengths.size()) return rs_lengths[m];
            return std::nullopt;
        }
        if (major < 0) return std::nullopt;
        const auto h = static_cast<std::size_t>(major - 1);
        if (h < hs_lengthss.size() && m < hs_lengthss[h].size()) return hs_lengthss[h][m];
        return std::nullopt;
    }
};

} // namespace tileprint

#endif // TILEPRINT_MODEL_ENCODING_H
