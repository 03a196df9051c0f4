#include "tsregress/core/errors.hpp"
#include "tsregress/forest/ensemble_member.hpp"
#include "tsregress/utils/logging.hpp"
#include <algorithm>
#include <random>

namespace tsregress::forest {

namespace {

constexpr std::uint64_t kSeedModulus = 2147483647ULL; // 2^31 - 1

} // namespace

std::size_t EnsembleMember::nIntervals() const {
	std::size_t total = 0;
	for (const auto &block : blocks) {
		total += block.intervals.size();
	}
	return total;
}

std::size_t EnsembleMember::nColumns() const {
	std::size_t total = 0;
	for (const auto &block : blocks) {
		total += block.nColumns();
	}
	return total;
}

std::vector<double> EnsembleMember::predict(const interval::IntervalFeatureExtractor &extractor,
                                            const std::vector<core::SeriesBatch> &representations) const {
	if (!learner) {
		throw std::runtime_error("EnsembleMember: member has no fitted learner.");
	}
	return learner->predict(extractor.extract(representations, blocks));
}

MemberBuilder::MemberBuilder(const std::vector<core::SeriesBatch> &representations,
                             const std::vector<double> &targets, std::vector<interval::ResolvedGeometry> geometry,
                             const ForestConfig &config)
    : representations_(representations), targets_(targets), geometry_(std::move(geometry)),
      extractor_(config.attributeRegistry(), config.replace_nan), prototype_(config.baseLearner()) {
	if (representations_.size() != geometry_.size()) {
		throw std::invalid_argument("MemberBuilder: one geometry per representation is required.");
	}
	subsamplers_.reserve(geometry_.size());
	for (std::size_t rep = 0; rep < geometry_.size(); ++rep) {
		subsamplers_.emplace_back(extractor_.registry(), config.attSubsampleFor(rep));
	}
}

std::uint32_t MemberBuilder::MemberSeed(std::uint32_t master_seed, std::size_t member_index) {
	const std::uint64_t base = (master_seed == 0 ? 255ULL : master_seed) % kSeedModulus;
	const std::uint64_t factor = (static_cast<std::uint64_t>(member_index) + 1) % kSeedModulus;
	return static_cast<std::uint32_t>((base * 37 % kSeedModulus) * factor % kSeedModulus);
}

std::uint32_t MemberBuilder::RetrySeed(std::uint32_t member_seed, std::size_t attempt) {
	std::seed_seq sequence {member_seed, static_cast<std::uint32_t>(attempt)};
	std::uint32_t seed = 0;
	sequence.generate(&seed, &seed + 1);
	return seed;
}

EnsembleMember MemberBuilder::build(std::size_t member_index, std::uint32_t seed, bool out_of_bag) const {
	std::uint32_t attempt_seed = seed;
	for (std::size_t attempt_number = 1;; ++attempt_number) {
		try {
			auto member = attempt(member_index, attempt_seed, out_of_bag);
			member.attempts = attempt_number;
			return member;
		} catch (const core::MemberBuildError &) {
			throw;
		} catch (const std::runtime_error &error) {
			// Learners report numerical fit failures as runtime errors; shape and configuration errors are not retried.
			if (attempt_number >= kMaxAttempts) {
				TSREGRESS_WARN("Member {} failed after {} attempts: {}", member_index, attempt_number, error.what());
				throw core::MemberBuildError("Member " + std::to_string(member_index) + " failed after " +
				                                 std::to_string(attempt_number) + " attempts: " + error.what(),
				                             member_index, attempt_number);
			}
			TSREGRESS_WARN("Member {} fit failed ({}); retrying with resampled geometry.", member_index,
			               error.what());
			attempt_seed = RetrySeed(seed, attempt_number);
		}
	}
}

EnsembleMember MemberBuilder::attempt(std::size_t member_index, std::uint32_t seed, bool out_of_bag) const {
	std::mt19937 rng(seed);

	EnsembleMember member;
	member.index = member_index;
	member.seed = seed;
	member.blocks.reserve(geometry_.size());
	for (std::size_t rep = 0; rep < geometry_.size(); ++rep) {
		interval::IntervalBlock block;
		block.representation = rep;
		block.intervals = interval::IntervalSampler(geometry_[rep], rep).sample(rng);
		block.attributes = subsamplers_[rep].subsample(rng);
		member.blocks.push_back(std::move(block));
	}

	const auto table = extractor_.extract(representations_, member.blocks);

	member.learner = prototype_->clone();
	member.learner->setSeed(seed);
	member.learner->fit(table, targets_);
	TSREGRESS_TRACE("Member {} fitted on {} columns with {}.", member_index, table.cols(),
	                member.learner->getName());

	if (out_of_bag) {
		const std::size_t n_cases = table.rows();
		std::uniform_int_distribution<std::size_t> draw(0, n_cases - 1);
		std::vector<std::size_t> bootstrap(n_cases);
		std::vector<bool> in_bag(n_cases, false);
		for (auto &row : bootstrap) {
			row = draw(rng);
			in_bag[row] = true;
		}
		for (std::size_t c = 0; c < n_cases; ++c) {
			if (!in_bag[c]) {
				member.oob_cases.push_back(c);
			}
		}
		if (!member.oob_cases.empty()) {
			std::vector<double> bootstrap_targets;
			bootstrap_targets.reserve(n_cases);
			for (auto row : bootstrap) {
				bootstrap_targets.push_back(targets_[row]);
			}
			auto bootstrap_learner = prototype_->clone();
			bootstrap_learner->setSeed(seed);
			bootstrap_learner->fit(table.selectRows(bootstrap), bootstrap_targets);
			member.oob_predictions = bootstrap_learner->predict(table.selectRows(member.oob_cases));
		}
	}
	return member;
}

} // namespace tsregress::forest
