#include "test_common.h"
#include "test_mocks.h"

#include "keel/events.h"
#include "keel/kernel.h"

#include <algorithm>
#include <memory>
#include <type_traits>
#include <utility>

using namespace keel;
using namespace mocks;

namespace {

struct Fixture {
    Account executor;
    std::shared_ptr<Kernel> kernel = std::make_shared<Kernel>(executor);
    MemoryEventSink events;

    Fixture() { kernel->set_event_sink(&events); }

    void exec(Action a, const ActionTarget& t) { kernel->execute_action(executor, a, t); }
};

bool contains(const std::vector<Address>& v, const Address& a) {
    return std::find(v.begin(), v.end(), a) != v.end();
}

// Overload pairs that report whether a call compiles from outside the class.
template <typename T>
auto can_init(int) -> decltype(std::declval<T&>().init(std::declval<const Kernel&>()), std::true_type{});
template <typename T>
std::false_type can_init(...);

template <typename T>
auto can_change_kernel(int)
    -> decltype(std::declval<T&>().change_kernel(std::declval<const Kernel&>(), std::declval<Kernel*>()),
                std::true_type{});
template <typename T>
std::false_type can_change_kernel(...);

template <typename T>
auto can_configure(int) -> decltype(std::declval<T&>().configure_dependencies(std::declval<const Kernel&>()),
                                    std::true_type{});
template <typename T>
std::false_type can_configure(...);

template <typename T>
auto can_receive_capability(int)
    -> decltype(std::declval<T&>().receive_capability(std::declval<const Kernel&>(), std::declval<const Capability&>()),
                std::true_type{});
template <typename T>
std::false_type can_receive_capability(...);

template <typename T>
auto can_public_call(int) -> decltype(std::declval<T&>().public_call(), std::true_type{});
template <typename T>
std::false_type can_public_call(...);

template <typename Caller>
auto can_execute_as(int) -> decltype(std::declval<Kernel&>().execute_action(std::declval<const Caller&>(),
                                                                            Action::ChangeExecutor,
                                                                            std::declval<const ActionTarget&>()),
                                     std::true_type{});
template <typename Caller>
std::false_type can_execute_as(...);

static_assert(decltype(can_public_call<MockModule>(0))::value, "public entry points stay callable");
static_assert(!decltype(can_init<MockModule>(0))::value, "only the kernel can run a module's init");
static_assert(!decltype(can_change_kernel<MockModule>(0))::value, "only the kernel can move a module");
static_assert(!decltype(can_change_kernel<MockPolicy>(0))::value, "only the kernel can move a policy");
static_assert(!decltype(can_configure<MockPolicy>(0))::value, "only the kernel can configure a policy");
static_assert(!decltype(can_receive_capability<MockPolicy>(0))::value, "only the kernel can hand out capabilities");
static_assert(decltype(can_execute_as<Account>(0))::value, "the executor acts with its account");
static_assert(!decltype(can_execute_as<Address>(0))::value, "an address is not a credential");
static_assert(!std::is_copy_constructible<Account>::value, "accounts cannot be cloned");
static_assert(!std::is_constructible<Account, Address>::value, "accounts cannot be minted for an existing address");

} // namespace

static void test_install_module() {
    Fixture f;
    auto mod = std::make_shared<MockModule>(f.kernel.get());

    f.exec(Action::InstallModule, mod);
    expect_true(f.kernel->get_module_for_keycode(to_keycode("MOCKY")) == mod, "lookup by keycode");
    expect_true(f.kernel->get_keycode_for_module(mod->address()) == to_keycode("MOCKY"), "lookup by address");
    expect_eq_ll(mod->init_count, 1, "init called once on install");
    expect_eq_ll((long long)f.kernel->all_keycodes().size(), 1, "one keycode installed");
    expect_eq_ll((long long)f.events.count(EventKind::ModuleInstalled), 1, "ModuleInstalled emitted");
    expect_eq_ll((long long)f.events.count(EventKind::ActionExecuted), 1, "ActionExecuted emitted");
}

static void test_duplicate_keycode_rejected() {
    Fixture f;
    auto a = std::make_shared<MockModule>(f.kernel.get());
    auto b = std::make_shared<MockModule>(f.kernel.get());
    f.exec(Action::InstallModule, a);

    const std::string before = f.kernel->snapshot_json();
    f.events.clear();
    expect_error(ErrorCode::ModuleAlreadyInstalled, [&] { f.exec(Action::InstallModule, b); },
                 "second module with same keycode rejected");
    expect_error(ErrorCode::ModuleAlreadyInstalled, [&] { f.exec(Action::InstallModule, a); },
                 "re-installing the same module rejected");
    expect_true(f.kernel->snapshot_json() == before, "duplicate install leaves registry unchanged");
    expect_true(f.kernel->get_module_for_keycode(to_keycode("MOCKY")) == a, "original module still installed");
    expect_eq_ll(b->init_count, 0, "rejected module never initialised");
    expect_true(f.events.events().empty(), "failed actions emit nothing");
}

static void test_install_rolls_back_on_init_failure() {
    Fixture f;
    auto mod = std::make_shared<MockModule>(f.kernel.get());
    mod->fail_init = true;

    const std::string before = f.kernel->snapshot_json();
    try {
        f.exec(Action::InstallModule, mod);
        die("install with failing init should throw");
    } catch (const std::runtime_error& e) {
        expect_true(std::string(e.what()).find("mock init failure") != std::string::npos, "init error propagates");
    }
    expect_true(f.kernel->snapshot_json() == before, "failed init leaves no registry entry");
    expect_true(!f.kernel->get_module_for_keycode(to_keycode("MOCKY")), "module not installed");
}

static void test_install_requires_trust() {
    Fixture f;
    Kernel other(f.executor);
    auto mod = std::make_shared<MockModule>(&other);
    expect_error(ErrorCode::OnlyKernel, [&] { f.exec(Action::InstallModule, mod); },
                 "module trusting another kernel refuses init");
    expect_true(f.kernel->all_keycodes().empty(), "nothing installed");

    auto pol = std::make_shared<MockPolicy>(f.kernel.get());
    expect_error(ErrorCode::InvalidTarget, [&] { f.exec(Action::InstallModule, pol); },
                 "policy is not a module");
}

static void test_rogue_kernel_cannot_adopt() {
    Fixture f;
    auto trsy = std::make_shared<Treasury>(f.kernel.get(), 100);
    auto cust = std::make_shared<Custodian>(f.kernel.get());
    f.exec(Action::InstallModule, trsy);
    f.exec(Action::ActivatePolicy, cust);

    // A second kernel run by someone else tries to take over live contracts.
    Account thief;
    auto rogue = std::make_shared<Kernel>(thief);
    expect_error(ErrorCode::OnlyKernel, [&] { rogue->execute_action(thief, Action::InstallModule, trsy); },
                 "module refuses init from an untrusted kernel");
    auto grabber = std::make_shared<MockPolicy>(rogue.get());
    grabber->perms = {{to_keycode("TRSY"), "withdraw"}};
    expect_error(ErrorCode::ModuleNotInstalled,
                 [&] { rogue->execute_action(thief, Action::ActivatePolicy, grabber); },
                 "rogue kernel cannot grant on a module it does not hold");
    expect_error(ErrorCode::OnlyKernel, [&] { rogue->execute_action(thief, Action::ActivatePolicy, cust); },
                 "policy refuses configuration from an untrusted kernel");
    expect_error(ErrorCode::OnlyExecutor, [&] { f.kernel->execute_action(thief, Action::MigrateKernel, rogue); },
                 "another kernel's executor cannot migrate this one");

    expect_true(trsy->kernel() == f.kernel.get(), "module still trusts its kernel");
    expect_true(cust->kernel() == f.kernel.get(), "policy still trusts its kernel");
    expect_true(rogue->all_keycodes().empty(), "rogue kernel holds nothing");
    expect_error(ErrorCode::PolicyNotPermitted, [&] { trsy->withdraw(grabber->cap(), 1); },
                 "no capability from the rogue kernel");
    cust->withdraw(10);
    expect_eq_ll(trsy->balance(), 90, "legitimate policy unaffected");
}

static void test_executor_exclusivity() {
    Fixture f;
    auto mod = std::make_shared<MockModule>(f.kernel.get());
    auto pol = std::make_shared<MockPolicy>(f.kernel.get());
    Account stranger;

    const std::string before = f.kernel->snapshot_json();
    const Action actions[] = {Action::InstallModule, Action::UpgradeModule, Action::DeprecateModule,
                              Action::ActivatePolicy, Action::DeactivatePolicy, Action::ChangeExecutor,
                              Action::MigrateKernel};
    for (Action a : actions) {
        expect_error(ErrorCode::OnlyExecutor, [&] { f.kernel->execute_action(stranger, a, mod); },
                     std::string("non-executor rejected for ") + action_name(a));
    }
    // Knowing the executor's address buys nothing without its account.
    expect_true(f.kernel->executor() == f.executor.address(), "executor address is public");
    Account impostor;
    expect_error(ErrorCode::OnlyExecutor, [&] { f.kernel->execute_action(impostor, Action::ChangeExecutor, impostor); },
                 "an account that is not the executor cannot seize the role");
    expect_true(f.kernel->snapshot_json() == before, "rejected callers cause zero mutation");
    expect_true(error_kind_of(ErrorCode::OnlyExecutor) == ErrorKind::Authorization, "authorization error kind");
}

static void test_change_executor() {
    Fixture f;
    Account next;
    f.exec(Action::ChangeExecutor, next);
    expect_true(f.kernel->executor() == next.address(), "executor replaced");
    expect_eq_ll((long long)f.events.count(EventKind::ExecutorChanged), 1, "ExecutorChanged emitted");

    auto mod = std::make_shared<MockModule>(f.kernel.get());
    expect_error(ErrorCode::OnlyExecutor, [&] { f.exec(Action::InstallModule, mod); },
                 "old executor loses authority immediately");
    f.kernel->execute_action(next, Action::InstallModule, mod);
    expect_true(f.kernel->get_module_for_keycode(to_keycode("MOCKY")) == mod, "new executor can act");

    expect_error(ErrorCode::InvalidTarget, [&] { f.kernel->execute_action(next, Action::ChangeExecutor, Address{}); },
                 "null executor rejected");
}

static void test_activation_grants_requested_permissions() {
    Fixture f;
    auto mod = std::make_shared<MockModule>(f.kernel.get());
    auto pol = std::make_shared<MockPolicy>(f.kernel.get());
    auto other = std::make_shared<MockPolicy>(f.kernel.get());
    Keycode kc = to_keycode("MOCKY");
    pol->deps = {kc};
    pol->perms = {{kc, "permissioned_call"}};

    f.exec(Action::InstallModule, mod);
    f.exec(Action::ActivatePolicy, pol);
    f.exec(Action::ActivatePolicy, other);

    expect_true(pol->is_active(), "policy active");
    expect_true(f.kernel->module_permissions(kc, pol->address(), "permissioned_call"), "requested triple granted");
    expect_true(!f.kernel->module_permissions(kc, pol->address(), "public_call"), "unrequested triple not granted");
    expect_true(!f.kernel->module_permissions(kc, other->address(), "permissioned_call"), "other policy not granted");
    expect_true(contains(f.kernel->module_dependents(kc), pol->address()), "dependent recorded");
    expect_true(!contains(f.kernel->module_dependents(kc), other->address()), "non-dependent not recorded");
    expect_eq_ll((long long)f.kernel->active_policies().size(), 2, "two active policies");

    pol->call(*mod);
    expect_eq_ll(mod->permissioned_state, 1, "permitted call went through");
    expect_error(ErrorCode::PolicyNotPermitted, [&] { other->call(*mod); }, "unpermitted policy rejected");
    expect_error(ErrorCode::PolicyNotPermitted, [&] { mod->permissioned_call(Capability()); }, "null capability rejected");
    expect_eq_ll(mod->permissioned_state, 1, "rejected calls change nothing");
    mod->public_call();
    expect_eq_ll(mod->public_state, 1, "public call unguarded");

    expect_error(ErrorCode::PolicyAlreadyActivated, [&] { f.exec(Action::ActivatePolicy, pol); },
                 "double activation rejected");
}

static void test_activation_atomicity() {
    Fixture f;
    auto mod = std::make_shared<MockModule>(f.kernel.get());
    f.exec(Action::InstallModule, mod);
    Keycode kc = to_keycode("MOCKY");

    // Missing dependency
    auto p1 = std::make_shared<MockPolicy>(f.kernel.get());
    p1->deps = {kc, to_keycode("NOPE")};
    p1->perms = {{kc, "permissioned_call"}};
    const std::string before = f.kernel->snapshot_json();
    expect_error(ErrorCode::ModuleNotInstalled, [&] { f.exec(Action::ActivatePolicy, p1); },
                 "activation with uninstalled dependency fails");
    expect_true(f.kernel->snapshot_json() == before, "no partial state after failed dependency check");
    expect_true(!p1->is_active(), "policy not recorded active");
    expect_true(p1->cap().is_null(), "no capability handed out");

    // Permission on an uninstalled keycode, after a valid grant in the same request list
    auto p2 = std::make_shared<MockPolicy>(f.kernel.get());
    p2->deps = {kc};
    p2->perms = {{kc, "permissioned_call"}, {to_keycode("NOPE"), "x"}};
    expect_error(ErrorCode::ModuleNotInstalled, [&] { f.exec(Action::ActivatePolicy, p2); },
                 "activation requesting uninstalled keycode fails");
    expect_true(!f.kernel->module_permissions(kc, p2->address(), "permissioned_call"), "earlier grant rolled back");
    expect_true(f.kernel->module_dependents(kc).empty(), "dependents rolled back");
    expect_true(f.kernel->snapshot_json() == before, "no partial state after failed grant");

    // Hook failure
    auto p3 = std::make_shared<MockPolicy>(f.kernel.get());
    p3->fail_configure_after = 0;
    try {
        f.exec(Action::ActivatePolicy, p3);
        die("activation with throwing hook should fail");
    } catch (const std::runtime_error&) {
    }
    expect_true(!p3->is_active(), "throwing hook leaves policy inactive");
}

static void test_scenario_custodian() {
    Fixture f;
    auto trsy = std::make_shared<Treasury>(f.kernel.get(), 1000);
    auto cust = std::make_shared<Custodian>(f.kernel.get());
    auto rival = std::make_shared<MockPolicy>(f.kernel.get());
    rival->deps = {to_keycode("TRSY")};

    f.exec(Action::InstallModule, trsy);
    f.exec(Action::ActivatePolicy, cust);
    f.exec(Action::ActivatePolicy, rival);

    cust->withdraw(100);
    expect_eq_ll(trsy->balance(), 900, "custodian withdrew");
    expect_error(ErrorCode::PolicyNotPermitted, [&] { trsy->withdraw(rival->cap(), 1); }, "rival cannot withdraw");

    f.exec(Action::DeactivatePolicy, cust);
    expect_true(!f.kernel->module_permissions(to_keycode("TRSY"), cust->address(), "withdraw"), "triple revoked");
    expect_error(ErrorCode::PolicyNotPermitted, [&] { cust->withdraw(1); }, "withdraw rejects deactivated custodian");
    expect_eq_ll(trsy->balance(), 900, "balance unchanged after rejection");
    expect_eq_ll((long long)f.events.count(EventKind::PolicyDeactivated), 1, "PolicyDeactivated emitted");
}

static void test_deactivation_and_reactivation() {
    Fixture f;
    auto mod = std::make_shared<MockModule>(f.kernel.get());
    auto pol = std::make_shared<MockPolicy>(f.kernel.get());
    Keycode kc = to_keycode("MOCKY");
    pol->deps = {kc};
    pol->perms = {{kc, "permissioned_call"}, {kc, "other_call"}};

    f.exec(Action::InstallModule, mod);
    f.exec(Action::ActivatePolicy, pol);
    Capability first = pol->cap();

    f.events.clear();
    f.exec(Action::DeactivatePolicy, pol);
    expect_eq_ll((long long)f.events.count(EventKind::PermissionsUpdated), 2, "one revoke event per triple");
    for (const auto& p : f.kernel->state().permissions) {
        expect_true(p.policy != pol->address(), "no triple for deactivated policy");
    }
    expect_true(f.kernel->module_dependents(kc).empty(), "dependent dropped");
    expect_error(ErrorCode::PolicyNotActivated, [&] { f.exec(Action::DeactivatePolicy, pol); },
                 "double deactivation rejected");
    expect_error(ErrorCode::PolicyNotActivated, [&] { f.exec(Action::DeactivatePolicy, new_account()); },
                 "deactivating unknown policy rejected");

    // Reactivation derives permissions only from the current request hook.
    pol->perms = {{kc, "other_call"}};
    f.exec(Action::ActivatePolicy, pol);
    expect_true(!f.kernel->module_permissions(kc, pol->address(), "permissioned_call"), "old triple not resurrected");
    expect_true(f.kernel->module_permissions(kc, pol->address(), "other_call"), "new request granted");
    expect_eq_ll(pol->configure_calls, 2, "dependencies re-declared on reactivation");

    expect_true(pol->cap().epoch() != first.epoch(), "fresh capability per activation");
    expect_true(!f.kernel->module_permissions(kc, first, "other_call"), "stale capability rejected");
    expect_true(f.kernel->module_permissions(kc, pol->cap(), "other_call"), "current capability accepted");
}

static void test_deprecate_module() {
    Fixture f;
    auto mod = std::make_shared<MockModule>(f.kernel.get());
    auto pol = std::make_shared<MockPolicy>(f.kernel.get());
    auto grantee = std::make_shared<MockPolicy>(f.kernel.get());
    Keycode kc = to_keycode("MOCKY");
    pol->deps = {kc};
    grantee->perms = {{kc, "permissioned_call"}};

    f.exec(Action::InstallModule, mod);
    f.exec(Action::ActivatePolicy, pol);
    f.exec(Action::ActivatePolicy, grantee);

    expect_error(ErrorCode::ModuleInUse, [&] { f.exec(Action::DeprecateModule, mod); },
                 "deprecation refused while a dependent is active");
    f.exec(Action::DeactivatePolicy, pol);
    expect_error(ErrorCode::ModuleInUse, [&] { f.exec(Action::DeprecateModule, mod); },
                 "deprecation refused while a permission is granted");
    f.exec(Action::DeactivatePolicy, grantee);

    f.exec(Action::DeprecateModule, mod);
    expect_true(!f.kernel->get_module_for_keycode(kc), "module removed");
    expect_true(!f.kernel->get_keycode_for_module(mod->address()), "address mapping removed");
    expect_eq_ll((long long)f.events.count(EventKind::ModuleDeprecated), 1, "ModuleDeprecated emitted");
    expect_error(ErrorCode::ModuleNotInstalled, [&] { f.exec(Action::DeprecateModule, mod); },
                 "deprecating twice rejected");

    // The keycode is free again.
    auto again = std::make_shared<MockModule>(f.kernel.get());
    f.exec(Action::InstallModule, again);
    expect_true(f.kernel->get_module_for_keycode(kc) == again, "keycode reusable after deprecation");
}

static void test_reentrancy_rejected() {
    Fixture f;
    auto pol = std::make_shared<MockPolicy>(f.kernel.get());
    auto mod = std::make_shared<ReentrantModule>(f.kernel.get(), f.executor);
    mod->reenter_with = pol;

    const std::string before = f.kernel->snapshot_json();
    expect_error(ErrorCode::Reentrant, [&] { f.exec(Action::InstallModule, mod); },
                 "administrative action from inside a hook rejected");
    expect_true(f.kernel->snapshot_json() == before, "outer action rolled back");
    expect_true(!pol->is_active(), "inner action never ran");

    // Guard released: the kernel still works.
    f.exec(Action::ActivatePolicy, pol);
    expect_true(pol->is_active(), "kernel usable after rejected re-entry");
}

static void test_migrate_kernel() {
    Fixture f;
    auto mod = std::make_shared<MockModule>(f.kernel.get());
    auto pol = std::make_shared<MockPolicy>(f.kernel.get());
    Keycode kc = to_keycode("MOCKY");
    pol->deps = {kc};
    pol->perms = {{kc, "permissioned_call"}};
    f.exec(Action::InstallModule, mod);
    f.exec(Action::ActivatePolicy, pol);

    auto next = std::make_shared<Kernel>(f.executor);
    expect_error(ErrorCode::InvalidTarget, [&] { f.exec(Action::MigrateKernel, f.kernel); },
                 "cannot migrate to self");
    expect_error(ErrorCode::InvalidTarget, [&] { f.exec(Action::MigrateKernel, mod); },
                 "migration target must be a kernel");

    f.exec(Action::MigrateKernel, next);
    expect_true(mod->kernel() == next.get(), "module trusts new kernel");
    expect_true(pol->kernel() == next.get(), "policy trusts new kernel");
    expect_true(f.kernel->is_retired(), "old kernel retired");
    expect_true(f.kernel->migrated_to() == next.get(), "old kernel records successor");
    expect_eq_ll((long long)f.events.count(EventKind::KernelMigrated), 1, "KernelMigrated emitted");

    expect_error(ErrorCode::KernelRetired, [&] { f.exec(Action::ChangeExecutor, new_account()); },
                 "retired kernel rejects actions");
    Kernel stale_owner(f.executor);
    expect_error(ErrorCode::OnlyKernel, [&] { stale_owner.execute_action(f.executor, Action::InstallModule, mod); },
                 "migrated module rejects every kernel but its new one");
    expect_error(ErrorCode::PolicyNotPermitted, [&] { pol->call(*mod); },
                 "old capability is meaningless to the new kernel");

    // The new kernel is populated by its executor.
    next->execute_action(f.executor, Action::InstallModule, mod);
    next->execute_action(f.executor, Action::ActivatePolicy, pol);
    expect_eq_ll(mod->init_count, 2, "module re-initialised by new kernel");
    pol->call(*mod);
    expect_eq_ll(mod->permissioned_state, 1, "permissions work under the new kernel");
}

static void test_snapshot_layout() {
    Fixture f;
    auto mod = std::make_shared<MockModule>(f.kernel.get());
    auto pol = std::make_shared<MockPolicy>(f.kernel.get());
    Keycode kc = to_keycode("MOCKY");
    pol->deps = {kc};
    pol->perms = {{kc, "permissioned_call"}};
    f.exec(Action::InstallModule, mod);
    f.exec(Action::ActivatePolicy, pol);

    const std::string snap = f.kernel->snapshot_json();
    for (const char* key : {"\"modules\"", "\"policies\"", "\"permissions\"", "\"dependents\"", "\"executor\""}) {
        expect_true(snap.find(key) != std::string::npos, std::string("snapshot has ") + key);
    }
    expect_true(snap.find("permissioned_call") != std::string::npos, "snapshot lists granted function");
    expect_true(f.kernel->state().digest().size() == 64, "state digest is SHA-256 hex");
}

int main() {
    test_install_module();
    test_duplicate_keycode_rejected();
    test_install_rolls_back_on_init_failure();
    test_install_requires_trust();
    test_rogue_kernel_cannot_adopt();
    test_executor_exclusivity();
    test_change_executor();
    test_activation_grants_requested_permissions();
    test_activation_atomicity();
    test_scenario_custodian();
    test_deactivation_and_reactivation();
    test_deprecate_module();
    test_reentrancy_rejected();
    test_migrate_kernel();
    test_snapshot_layout();

    std::cerr << "test_kernel: ALL PASSED" << std::endl;
    return 0;
}
