#pragma once

#include "interfaces.hpp"
#include "datatypes.hpp"
#include <string>
#include <utility>
#include <vector>
#include <memory>

namespace strategy_engine {

    // --- TechnicalStrategy Class ---
    // Ordered rule list over indicator values; the first rule that holds produces the signal.
    class TechnicalStrategy : public ISignalStrategy {
    public:
        // `cross_pairs` lists every relation referenced by a Cross condition; their
        // crossing state is refreshed once per bar before any rule runs.
        TechnicalStrategy(std::string name,
                          std::vector<std::unique_ptr<IRule>> rules,
                          std::vector<CrossPair> cross_pairs);

        virtual ~TechnicalStrategy() override = default;

        std::string getName() const override;
        core::Signal evaluate(const indicators::IndicatorSnapshot& snapshot,
                              const std::vector<indicators::IndicatorSnapshot>& recent,
                              CrossingState& state) const override;

        const std::vector<std::unique_ptr<IRule>>& getRules() const { return rules_; }
        const std::vector<CrossPair>& getCrossPairs() const { return cross_pairs_; }

    private:
        void refreshCrossings(const indicators::IndicatorSnapshot& snapshot, CrossingState& state) const;

        std::string name_;
        std::vector<std::unique_ptr<IRule>> rules_;
        std::vector<CrossPair> cross_pairs_;
    };

} // namespace strategy_engine
