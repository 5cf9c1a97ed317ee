#include <tileprint/extract/coordinate_extractor.h>
#include <tileprint/extract/value_access.h>

#include <optional>

namespace tileprint {

namespace {

IntList sequence_or_empty(const TypeNode* node) {
    if (!node) return {};
    return node->sequence_values().value_or(IntList{});
}

std::vector<IntList> sequences_of(const TypeNode* tuple) {
    std::vector<IntList> out;
    if (!tuple) return out;
    for (const auto& seq : tuple->args) out.push_back(sequence_or_empty(&seq));
    return out;
}

AccessResult<HiddenIndex> read_hidden(const LiveValue& idx_hidden, std::size_t count, bool count_known,
                                      std::int64_t max_sane) {
    // multi_index keeps its values in `data`; fall back to indexing the value itself
    auto data = idx_hidden.field("data");
    const LiveValue& source = data ? **data : idx_hidden;

    HiddenIndex values;
    std::size_t readable{0};
    std::optional<AccessFailure> first_failure;
    for (std::size_t i = 0; i < count; ++i) {
        auto item = source.element(i).and_then([&](const LiveValuePtr& v) { return read_integer(*v, max_sane); });
        if (!item) {
            if (!first_failure) first_failure = item.failure();
            // without a count from the type the first failure marks the end
            if (!count_known) break;
        } else {
            ++readable;
        }
        values.emplace_back(std::move(item));
    }
    if (readable == 0 && first_failure) return *first_failure;
    return values;
}

} // namespace

CoordinateModel extract_coordinate(const TypeNode& type, const LiveValue& value, const RenderOptions& options) {
    CoordinateModel model;
    if (const TypeNode* n = type.arg(0)) model.ndim_hidden = n->as_integer().value_or(0);

    if (type.is("tensor_coordinate")) {
        model.entity = CoordinateEntity::Coordinate;
        model.bottom_dimension_ids = IntList{0};
        model.top_dimension_ids = sequence_or_empty(type.args.empty() ? nullptr : &type.args.back());
    } else {
        model.entity = CoordinateEntity::AdaptorCoordinate;
        model.bottom_dimension_ids = sequence_or_empty(type.arg(1));
        model.top_dimension_ids = sequence_or_empty(type.arg(2));
    }

    const bool count_known = model.ndim_hidden > 0;
    const std::size_t count = count_known ? static_cast<std::size_t>(model.ndim_hidden) : options.default_max_dims;
    auto hidden = value.field("idx_hidden_").and_then([&](const LiveValuePtr& v) {
        return read_hidden(*v, count, count_known, options.max_sane_value);
    });
    if (hidden) model.idx_hidden = std::move(hidden).value();
    else if (hidden.failure().reason != AccessFailureReason::TypeOnly) model.idx_hidden = hidden.failure();
    return model;
}

std::optional<DistributionEncoding> extract_encoding(const TypeNode& encoding_type) {
    if (!encoding_type.is("tile_distribution_encoding")) return std::nullopt;
    DistributionEncoding e;
    e.rs_lengths = sequence_or_empty(encoding_type.arg(0));
    e.hs_lengthss = sequences_of(encoding_type.arg(1));
    e.ps_to_rhss_major = sequences_of(encoding_type.arg(2));
    e.ps_to_rhss_minor = sequences_of(encoding_type.arg(3));
    e.ys_to_rhs_major = sequence_or_empty(encoding_type.arg(4));
    e.ys_to_rhs_minor = sequence_or_empty(encoding_type.arg(5));
    return e;
}

} // namespace tileprint
