#include "liqsim/agents/i_agent_behavior.hpp"
#include "liqsim/agents/repo_market.hpp"

#include <algorithm>
#include <limits>

namespace liqsim {

// -----------------------------------------------------------------------------
// Default cap: a fraction of the named holding. Repo asks carry no cap of
// their own; the connected banks bound them.
// -----------------------------------------------------------------------------
double IAgentBehavior::stepCap(const WaterfallStep& step,
                               const domain::AgentState& agent,
                               const ReactionContext& ctx) const {
  (void)ctx;
  if (step.cap_basis != CapBasis::Holding) {
    if (step.action_class == domain::ActionClass::Repo) {
      return std::numeric_limits<double>::infinity();
    }
    return 0.0;
  }
  const double held = domain::itemAmount(agent.balance_sheet, step.item);
  return std::max(0.0, held * step.cap_fraction);
}

// -----------------------------------------------------------------------------
// Default execution: repo steps are bank-assessed, everything else is taken
// in full
// -----------------------------------------------------------------------------
double IAgentBehavior::executeStep(const WaterfallStep& step, double target,
                                   domain::AgentState& agent,
                                   const ReactionContext& ctx) const {
  if (step.action_class == domain::ActionClass::Repo) {
    return seekRepo(agent, target, ctx).granted;
  }
  return target;
}

}  // namespace liqsim
