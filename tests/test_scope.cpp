#include "test_framework.hpp"

#include "strata/scope/scope.hpp"
#include "strata/scope/tenancy.hpp"
#include "strata/store/memory_store.hpp"

#include <memory>
#include <thread>

namespace {

using strata::scope::FieldMatch;

std::shared_ptr<strata::scope::TenancyManager> provisioned(const std::string &fields) {
  auto store = std::make_shared<strata::store::InMemoryStore>();
  auto tenancy = std::make_shared<strata::scope::TenancyManager>(store);
  const auto schema = strata::scope::ScopeSchema::parse(fields);
  if (!schema.ok() || !tenancy->provision(schema.value()).ok()) {
    throw std::runtime_error("provisioning failed for " + fields);
  }
  return tenancy;
}

} // namespace

void register_scope_tests(std::vector<strata::tests::TestCase> &tests) {
  using strata::tests::require;
  namespace scope = strata::scope;
  using strata::common::ErrorKind;

  tests.push_back({"scope_schema_parse_ordered_fields", [] {
                     const auto schema = scope::ScopeSchema::parse("project_id:string, agent_id:integer");
                     require(schema.ok(), schema.error());
                     require(schema.value().size() == 2, "two fields");
                     require(schema.value().fields()[0].name == "project_id", "order kept");
                     require(schema.value().fields()[1].type == scope::FieldType::Integer,
                             "integer type");
                     const auto swapped = scope::ScopeSchema::parse("agent_id:integer, project_id:string");
                     require(swapped.ok(), swapped.error());
                     require(swapped.value().fingerprint() != schema.value().fingerprint(),
                             "field order must change the fingerprint");
                   }});

  tests.push_back({"scope_schema_parse_rejects_bad_input", [] {
                     require(!scope::ScopeSchema::parse("").ok(), "empty schema accepted");
                     require(!scope::ScopeSchema::parse("a:string, a:string").ok(),
                             "duplicate field accepted");
                     require(!scope::ScopeSchema::parse("bad-name:string").ok(),
                             "invalid identifier accepted");
                     require(!scope::ScopeSchema::parse("a:float").ok(), "unknown type accepted");
                   }});

  tests.push_back({"scope_tenancy_validate_orders_values", [] {
                     auto tenancy = provisioned("project_id:string, agent_id:string");
                     const auto key = tenancy->validate({{"agent_id", "a1"}, {"project_id", "p1"}});
                     require(key.ok(), key.error());
                     require(key.value().entries()[0].first == "project_id", "schema order");
                     require(key.value().value("agent_id") == "a1", "value lookup");
                     const auto same = tenancy->validate({{"project_id", "p1"}, {"agent_id", "a1"}});
                     require(same.ok() && same.value() == key.value(), "keys should be equal");
                   }});

  tests.push_back({"scope_tenancy_rejects_mismatched_values", [] {
                     auto tenancy = provisioned("project_id:string, agent_id:integer");
                     const auto missing = tenancy->validate({{"project_id", "p1"}});
                     require(!missing.ok() && missing.kind() == ErrorKind::ScopeSchemaMismatch,
                             "missing field accepted");
                     const auto extra = tenancy->validate(
                         {{"project_id", "p1"}, {"agent_id", "7"}, {"user_id", "u"}});
                     require(!extra.ok() && extra.kind() == ErrorKind::ScopeSchemaMismatch,
                             "unknown field accepted");
                     const auto bad_int = tenancy->validate({{"project_id", "p1"}, {"agent_id", "x"}});
                     require(!bad_int.ok() && bad_int.kind() == ErrorKind::ScopeSchemaMismatch,
                             "non-integer accepted");
                     require(tenancy->validate({{"project_id", "p1"}, {"agent_id", "42"}}).ok(),
                             "integer rejected");
                   }});

  tests.push_back({"scope_tenancy_rejects_control_characters", [] {
                     auto tenancy = provisioned("project_id:string, agent_id:string");
                     const auto framed = tenancy->validate(
                         {{"project_id", std::string("a\x1f" "agent_id\x1e" "b")}, {"agent_id", "c"}});
                     require(!framed.ok() && framed.kind() == ErrorKind::ScopeSchemaMismatch,
                             "separator bytes accepted");
                     const auto newline = tenancy->validate({{"project_id", "p1\n"}, {"agent_id", "a"}});
                     require(!newline.ok() && newline.kind() == ErrorKind::ScopeSchemaMismatch,
                             "newline accepted");
                     const auto selector = tenancy->validate_selector(
                         {{"project_id", FieldMatch::any_of({"p1", std::string("p2\x7f")})},
                          {"agent_id", FieldMatch::exact("a")}});
                     require(!selector.ok() && selector.kind() == ErrorKind::ScopeSchemaMismatch,
                             "selector value with DEL accepted");
                     require(tenancy->validate({{"project_id", "p 1"}, {"agent_id", "a-1"}}).ok(),
                             "printable values rejected");
                   }});

  tests.push_back({"scope_key_ids_cannot_collide", [] {
                     const scope::ScopeKey crafted(
                         {{"project_id", std::string("a\x1f" "agent_id\x1e" "b")}, {"agent_id", "c"}});
                     const scope::ScopeKey honest(
                         {{"project_id", "a"}, {"agent_id", std::string("b\x1f" "agent_id\x1e" "c")}});
                     require(crafted.id() != honest.id(), "distinct scopes share an id");
                     const scope::ScopeKey left({{"project_id", "ab"}, {"agent_id", "c"}});
                     const scope::ScopeKey right({{"project_id", "a"}, {"agent_id", "bc"}});
                     require(left != right, "shifted values share an id");
                     require(left == scope::ScopeKey({{"project_id", "ab"}, {"agent_id", "c"}}),
                             "equal entries differ");
                   }});

  tests.push_back({"scope_tenancy_schema_is_locked_after_provision", [] {
                     auto store = std::make_shared<strata::store::InMemoryStore>();
                     scope::TenancyManager first(store);
                     const auto schema = scope::ScopeSchema::parse("project_id:string, agent_id:string");
                     require(first.provision(schema.value()).ok(), "first provision failed");

                     scope::TenancyManager second(store);
                     const auto other = scope::ScopeSchema::parse("user_id:string");
                     const auto status = second.provision(other.value());
                     require(!status.ok(), "different schema accepted");
                     require(status.kind() == ErrorKind::ScopeSchemaMismatch, "wrong error kind");

                     scope::TenancyManager third(store);
                     require(third.provision(schema.value()).ok(), "same schema should reopen");
                     require(third.meta().fingerprint == schema.value().fingerprint(),
                             "fingerprint not persisted");
                   }});

  tests.push_back({"scope_selector_matching_and_expansion", [] {
                     auto tenancy = provisioned("project_id:string, agent_id:string");
                     const auto selector = tenancy->validate_selector(
                         {{"project_id", FieldMatch::exact("p1")},
                          {"agent_id", FieldMatch::any_of({"a1", "a2", "a1"})}});
                     require(selector.ok(), selector.error());
                     const auto &sel = selector.value();
                     require(!sel.is_single_exact(), "any-of is not single exact");
                     require(sel.combination_count() == 2, "duplicates should collapse");
                     require(sel.expand().size() == 2, "expand count");
                     require(sel.to_string() == "project_id=p1,agent_id={a1|a2}", sel.to_string());

                     const auto a1 = tenancy->validate({{"project_id", "p1"}, {"agent_id", "a1"}});
                     const auto a3 = tenancy->validate({{"project_id", "p1"}, {"agent_id", "a3"}});
                     const auto p2 = tenancy->validate({{"project_id", "p2"}, {"agent_id", "a1"}});
                     require(sel.matches(a1.value()), "a1 should match");
                     require(!sel.matches(a3.value()), "a3 should not match");
                     require(!sel.matches(p2.value()), "p2 should not match");
                   }});

  tests.push_back({"scope_selector_wildcards", [] {
                     auto tenancy = provisioned("project_id:string, agent_id:string");
                     const auto partial = tenancy->validate_selector(
                         {{"project_id", FieldMatch::exact("p1")},
                          {"agent_id", FieldMatch::wildcard()}});
                     require(partial.ok(), partial.error());
                     require(partial.value().has_wildcard(), "has wildcard");
                     require(!partial.value().all_wildcard(), "not all wildcard");
                     require(partial.value().combination_count() == 1, "wildcards do not count");
                     const auto any = tenancy->validate({{"project_id", "p1"}, {"agent_id", "zz"}});
                     require(partial.value().matches(any.value()), "wildcard should match");

                     const auto all = tenancy->validate_selector(
                         {{"project_id", FieldMatch::wildcard()},
                          {"agent_id", FieldMatch::wildcard()}});
                     require(all.ok() && all.value().all_wildcard(), "all wildcard");

                     const auto missing =
                         tenancy->validate_selector({{"project_id", FieldMatch::exact("p1")}});
                     require(!missing.ok() && missing.kind() == ErrorKind::ScopeSchemaMismatch,
                             "selector missing a field accepted");
                   }});

  tests.push_back({"scope_taxonomy_version_bumps", [] {
                     auto tenancy = provisioned("project_id:string");
                     const auto before = tenancy->meta().taxonomy_version;
                     require(tenancy->bump_taxonomy_version().ok(), "bump failed");
                     require(tenancy->meta().taxonomy_version == before + 1, "version not bumped");
                     require(tenancy->record_pipeline_revision("memorize@2").ok(), "record failed");
                     require(tenancy->meta().pipeline_revision == "memorize@2", "token not kept");
                   }});

  tests.push_back({"scope_locks_are_shared_per_scope", [] {
                     auto tenancy = provisioned("project_id:string");
                     scope::ScopeLocks locks;
                     const auto p1 = tenancy->validate({{"project_id", "p1"}}).value();
                     const auto p2 = tenancy->validate({{"project_id", "p2"}}).value();
                     require(locks.lock_for(p1) == locks.lock_for(p1), "same scope same mutex");
                     require(locks.lock_for(p1) != locks.lock_for(p2), "scopes share a mutex");
                   }});

  tests.push_back({"scope_locks_sweep_idle_entries", [] {
                     auto tenancy = provisioned("project_id:string");
                     scope::ScopeLocks locks;
                     const auto held_key = tenancy->validate({{"project_id", "held"}}).value();
                     const auto held = locks.lock_for(held_key);
                     std::unique_lock<std::mutex> guard(*held);
                     for (int i = 0; i < 1'000; ++i) {
                       const auto key =
                           tenancy->validate({{"project_id", "p" + std::to_string(i)}}).value();
                       const auto lock = locks.lock_for(key);
                       require(lock != nullptr, "lock handed out");
                     }
                     require(locks.size() <= scope::ScopeLocks::kMinSweepSize,
                             "idle entries retained");
                     require(locks.lock_for(held_key) == held, "held mutex was swept");
                   }});
}
