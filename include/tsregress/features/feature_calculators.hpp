#pragma once

#include "tsregress/features/feature_types.hpp"

namespace tsregress::features {

/// Registers the 22 catch22 descriptors in their canonical order.
void RegisterCatch22Features(FeatureRegistry &registry);

/// Registers mean, std (population) and slope (least squares against the time index).
void RegisterSummaryFeatures(FeatureRegistry &registry);

/// Catch22 followed by the summary statistics: the canonical interval battery.
void RegisterCanonicalFeatures(FeatureRegistry &registry);

} // namespace tsregress::features
