#pragma once

#include "strata/runner/runner.hpp"

namespace strata::runner {

/// Sequential execution in the caller's thread without retries.
class InlineRunner final : public IWorkflowRunner {
public:
  explicit InlineRunner(std::shared_ptr<store::IMetadataStore> store);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] RunOutcome run(const pipeline::RevisionPtr &revision,
                               pipeline::WorkflowState state,
                               const pipeline::StepServices &services,
                               const RunContext &context) override;

private:
  std::shared_ptr<store::IMetadataStore> store_;
};

} // namespace strata::runner
