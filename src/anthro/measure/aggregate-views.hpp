
#pragma once

#include "measurement-set.hpp"
#include "params.hpp"

namespace anthro
{
/**
 * Merges per-view sets into one COMBINED set.
 *
 * For each field, values not estimated from the front view alone are
 * authoritative, and are used whenever any are present. A field with one
 * value passes through unchanged. Several values conflict when
 * `max - min > conflict_tolerance * min`. They merge into their
 * confidence-weighted mean, at their lowest confidence. Any conflict makes
 * the result inaccurate.
 *
 * Throws if 'sets' is empty, or mixes capture sessions or users.
 */
ReconciledMeasurementSet
aggregate_views(const vector<MeasurementSet>& sets,
                const AggregateParams& params,
                const Timestamp& timestamp) noexcept(false);

} // namespace anthro
