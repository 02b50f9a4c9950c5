#include <ResidentCore.hpp>
#include <cassert>
#include <iostream>
#include <algorithm>

#include "GuardTests.hpp"
#include "EntryTests.hpp"
#include "ScopeTests.hpp"
#include "TransactionTests.hpp"
#include "LeakTests.hpp"
#include "ConfigurationTests.hpp"

// ============================================================================
// Model Definitions
// ============================================================================

struct Person {
    std::string name;
    int age;
};

struct Dog {
    std::string name;
    double weight;
};

template<typename Error, typename Fn>
static bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

// ============================================================================
// Test: Lookups in both directions
// ============================================================================

void test_register_and_lookup() {
    std::cout << "Testing register and lookup..." << std::endl;

    auto registry = resident::live_registry::create();
    auto scope = registry->new_scope();

    auto alice = std::make_shared<Person>(Person{"Alice", 30});
    auto rex = std::make_shared<Dog>(Dog{"Rex", 12.5});
    auto stranger = std::make_shared<Person>(Person{"Nobody", 0});

    registry->register_object("person-1", alice);
    registry->register_object("dog-1", rex);

    assert(registry->object_to_id(alice) == "person-1");
    assert(registry->id_to_object("dog-1") == rex);
    assert(registry->id_to_object("missing") == nullptr);
    assert(!registry->object_to_id(stranger).has_value());
    assert(!registry->object_to_id(nullptr).has_value());

    // Identity is the allocation, not the value
    auto twin = std::make_shared<Person>(*alice);
    assert(!registry->object_to_id(twin).has_value());

    // Aliasing pointers share the owner, so they resolve too
    std::shared_ptr<void> alias(alice, &alice->name);
    assert(registry->object_to_id(alias) == "person-1");

    auto objects = registry->ids_to_objects({"person-1", "missing", "dog-1"});
    assert(objects.size() == 3);
    assert(objects[0] == alice);
    assert(objects[1] == nullptr);
    assert(objects[2] == rex);

    auto ids = registry->objects_to_ids({alice, stranger});
    assert(ids.size() == 2);
    assert(ids[0] == "person-1");
    assert(!ids[1].has_value());

    auto live = registry->live_ids();
    std::sort(live.begin(), live.end());
    assert(live.size() == 2);
    assert(live[0] == "dog-1");
    assert(live[1] == "person-1");
    assert(registry->live_objects().size() == 2);

    // Unregistered objects have no info and are not in storage
    assert(!registry->object_in_storage(alice));
    assert(!registry->object_info_for(stranger).has_value());

    std::cout << "  Register and lookup test passed!" << std::endl;
}

// ============================================================================
// Test: Duplicate registrations
// ============================================================================

void test_duplicate_registration() {
    std::cout << "Testing duplicate registration..." << std::endl;

    auto registry = resident::live_registry::create();
    auto scope = registry->new_scope();

    auto alice = std::make_shared<Person>(Person{"Alice", 30});
    auto bob = std::make_shared<Person>(Person{"Bob", 40});
    registry->register_object("person-1", alice);

    // Id taken by a live object
    assert(throws<resident::already_registered_error>([&] {
        registry->register_object("person-1", bob);
    }));

    // Object already registered under another id
    assert(throws<resident::already_registered_error>([&] {
        registry->register_object("person-2", alice);
    }));

    // Same id with the same object is still a duplicate
    assert(throws<resident::already_registered_error>([&] {
        registry->register_object("person-1", alice);
    }));

    assert(registry->object_to_id(alice) == "person-1");
    assert(!registry->object_to_id(bob).has_value());

    assert(throws<resident::invalid_argument_error>([&] {
        registry->register_object("person-3", nullptr);
    }));
    assert(throws<resident::invalid_argument_error>([&] {
        registry->register_object("", bob);
    }));

    std::cout << "  Duplicate registration test passed!" << std::endl;
}

// ============================================================================
// Test: Ids become reusable once the object is reclaimed
// ============================================================================

void test_id_reusable_after_reclaim() {
    std::cout << "Testing id reuse after reclaim..." << std::endl;

    auto registry = resident::live_registry::create();
    auto outer = registry->new_scope();

    std::weak_ptr<Person> first;
    {
        auto inner = registry->new_scope();
        auto alice = std::make_shared<Person>(Person{"Alice", 30});
        first = alice;
        registry->register_object("person-1", alice);
    }
    assert(first.expired());
    assert(registry->id_to_object("person-1") == nullptr);

    auto again = std::make_shared<Person>(Person{"Alice again", 31});
    registry->register_object("person-1", again);
    assert(registry->id_to_object("person-1") == again);
    assert(registry->object_to_id(again) == "person-1");

    // Removed records never leave a stale slot behind either
    registry->remove(resident::object_ref(again));
    assert(registry->id_to_object("person-1") == nullptr);
    registry->register_object("person-1", std::make_shared<Person>(Person{"Third", 1}));

    std::cout << "  Id reuse test passed!" << std::endl;
}

// ============================================================================
// Test: Registration without an open scope
// ============================================================================

void test_registration_requires_scope() {
    std::cout << "Testing registration without a scope..." << std::endl;

    auto registry = resident::live_registry::create();
    auto alice = std::make_shared<Person>(Person{"Alice", 30});
    auto e = resident::entry::make("person-1");

    assert(throws<resident::no_open_scope_error>([&] {
        registry->register_object("person-1", alice);
    }));
    assert(throws<resident::no_open_scope_error>([&] {
        registry->register_entry("person-1", e);
    }));
    assert(throws<resident::no_open_scope_error>([&] {
        registry->register_object_and_entry("person-1", alice, e);
    }));
    assert(throws<resident::no_open_scope_error>([&] {
        registry->insert({std::string("person-1"), resident::object_ref(alice)});
    }));
    assert(throws<resident::no_open_scope_error>([&] {
        registry->insert_entries({e});
    }));

    // All of them are registry errors
    assert(throws<resident::registry_error>([&] {
        registry->register_object("person-1", alice);
    }));

    assert(registry->live_ids().empty());
    assert(registry->loaded_ids().empty());

    std::cout << "  Registration without a scope test passed!" << std::endl;
}

// ============================================================================
// Test: Entries are never registered as objects
// ============================================================================

void test_entry_rejected_as_object() {
    std::cout << "Testing entries passed as objects..." << std::endl;

    auto registry = resident::live_registry::create();
    auto scope = registry->new_scope();

    assert(throws<resident::invalid_argument_error>([&] {
        registry->register_object("c", resident::entry::make("z"));
    }));
    assert(throws<resident::invalid_argument_error>([&] {
        registry->insert_pairs({{std::string("a"), resident::entry::make("x")}});
    }));
    assert(throws<resident::invalid_argument_error>([&] {
        registry->register_object_and_entry("d", resident::entry::make("w"), resident::entry::make("d"));
    }));

    // Type-erased entries are caught once the registry tracks them
    auto known = resident::entry::make("k", nullptr, "Person");
    registry->register_entry("k", known);
    assert(throws<resident::invalid_argument_error>([&] {
        registry->insert({std::string("b"), resident::object_ref(known)});
    }));
    assert(throws<resident::invalid_argument_error>([&] {
        registry->register_object("b", resident::object_ref(known));
    }));

    // An entry cannot be the object it describes
    auto own = resident::entry::make("e", nullptr, "Person");
    assert(throws<resident::invalid_argument_error>([&] {
        registry->register_object_and_entry("e", resident::object_ref(own), own);
    }));

    assert(registry->live_ids().empty());
    assert(!registry->object_to_id(known).has_value());
    assert(registry->id_to_entry("k") == known);

    std::cout << "  Entries passed as objects test passed!" << std::endl;
}

// ============================================================================
// Test: Entries
// ============================================================================

void test_register_entry() {
    std::cout << "Testing register_entry..." << std::endl;

    auto registry = resident::live_registry::create();
    auto scope = registry->new_scope();

    auto v1 = resident::entry::make("person-1", {{"name", "Alice"}}, "Person");
    registry->register_entry("person-1", v1);
    assert(registry->id_to_entry("person-1") == v1);

    // Replacing the entry: the old one dying must not clear the new slot
    auto v2 = resident::entry::revise(v1, {{"name", "Alicia"}});
    registry->register_entry("person-1", v2);
    assert(registry->id_to_entry("person-1") == v2);

    std::weak_ptr<resident::entry> watch_v1 = v1;
    v1.reset();
    assert(!watch_v1.expired());   // still v2->prev()
    v2->set_prev(nullptr);
    assert(watch_v1.expired());
    registry->sweep();
    assert(registry->id_to_entry("person-1") == v2);

    // Entry reclaimed: lookup is absent, the id leaves loaded_ids
    std::weak_ptr<resident::entry> watch_v2 = v2;
    v2.reset();
    assert(watch_v2.expired());
    assert(registry->id_to_entry("person-1") == nullptr);
    assert(registry->loaded_ids().empty());
    assert(registry->sweep() == 1);

    auto entries = registry->ids_to_entries({"person-1", "nothing"});
    assert(entries.size() == 2);
    assert(entries[0] == nullptr && entries[1] == nullptr);

    assert(throws<resident::invalid_argument_error>([&] {
        registry->register_entry("person-1", nullptr);
    }));

    std::cout << "  register_entry test passed!" << std::endl;
}

void test_register_object_and_entry() {
    std::cout << "Testing register_object_and_entry..." << std::endl;

    auto registry = resident::live_registry::create();
    auto scope = registry->new_scope();

    auto alice = std::make_shared<Person>(Person{"Alice", 30});
    auto e = resident::entry::make("person-1", {{"name", "Alice"}}, "Person");
    registry->register_object_and_entry("person-1", alice, e, resident::registration_options::stored());

    assert(registry->object_to_entry(alice) == e);
    assert(registry->id_to_entry("person-1") == e);
    assert(registry->object_in_storage(alice));

    auto found = registry->objects_to_entries({alice, nullptr});
    assert(found.size() == 2);
    assert(found[0] == e);
    assert(found[1] == nullptr);

    // A pass-through entry wrapping its own object must not pin it
    std::weak_ptr<Dog> watch;
    {
        auto inner = registry->new_scope();
        auto rex = std::make_shared<Dog>(Dog{"Rex", 12.5});
        watch = rex;
        auto wrapper = resident::entry::make_passthrough("dog-1", rex, "Dog");
        registry->register_object_and_entry("dog-1", rex, wrapper);
        assert(wrapper->object_is_weak());
        assert(registry->id_to_entry("dog-1") == wrapper);
    }
    assert(watch.expired());
    assert(registry->id_to_object("dog-1") == nullptr);
    assert(registry->id_to_entry("dog-1") == nullptr);

    std::cout << "  register_object_and_entry test passed!" << std::endl;
}

// ============================================================================
// Test: insert
// ============================================================================

void test_insert() {
    std::cout << "Testing insert..." << std::endl;

    auto registry = resident::live_registry::create();
    auto scope = registry->new_scope();

    auto alice = std::make_shared<Person>(Person{"Alice", 30});
    auto rex = std::make_shared<Dog>(Dog{"Rex", 12.5});
    auto loaded = resident::entry::make("dog-1", {{"name", "Rex"}}, "Dog");

    // Flat key/object list, keys are ids or entries
    registry->insert({std::string("person-1"), resident::object_ref(alice), loaded, resident::object_ref(rex)});

    assert(registry->id_to_object("person-1") == alice);
    assert(!registry->object_in_storage(alice));
    assert(registry->object_to_entry(alice) == nullptr);

    // Entry keys mean the object came from storage
    assert(registry->id_to_object("dog-1") == rex);
    assert(registry->object_in_storage(rex));
    assert(registry->object_to_entry(rex) == loaded);
    assert(registry->id_to_entry("dog-1") == loaded);

    auto bob = std::make_shared<Person>(Person{"Bob", 40});
    auto carol = std::make_shared<Person>(Person{"Carol", 50});

    assert(throws<resident::invalid_argument_error>([&] {
        registry->insert({std::string("person-2")});
    }));
    assert(throws<resident::invalid_argument_error>([&] {
        registry->insert({resident::object_ref(bob), resident::object_ref(carol)});
    }));
    assert(throws<resident::invalid_argument_error>([&] {
        registry->insert({std::string("person-2"), resident::entry::make("person-2")});
    }));
    assert(throws<resident::invalid_argument_error>([&] {
        registry->insert({std::string("person-2"), resident::object_ref()});
    }));
    assert(throws<resident::invalid_argument_error>([&] {
        registry->insert({resident::entry::make(""), resident::object_ref(bob)});
    }));
    assert(!registry->object_to_id(bob).has_value());

    // Typed pairs
    registry->insert_pairs({
        {std::string("person-2"), bob},
        {resident::entry::make("person-3", {{"name", "Carol"}}, "Person"), carol},
    });
    assert(registry->object_to_id(bob) == "person-2");
    assert(registry->object_to_id(carol) == "person-3");
    assert(registry->object_in_storage(carol));
    assert(registry->live_ids().size() == 4);

    std::cout << "  Insert test passed!" << std::endl;
}

// ============================================================================
// Test: insert_entries (prefetch)
// ============================================================================

void test_insert_entries() {
    std::cout << "Testing insert_entries..." << std::endl;

    auto registry = resident::live_registry::create();
    auto scope = registry->new_scope();

    auto alice = std::make_shared<Person>(Person{"Alice", 30});
    auto current = resident::entry::make("person-1", {{"name", "Alice"}}, "Person");
    registry->insert_pairs({{current, alice}});

    auto stale = resident::entry::make("person-1", {{"name", "Old Alice"}}, "Person");
    auto fresh = resident::entry::make("person-2", {{"name", "Bob"}}, "Person");
    registry->insert_entries({stale, fresh});

    // Live object keeps its entry, the unloaded id gets the prefetched one
    assert(registry->id_to_entry("person-1") == current);
    assert(registry->id_to_entry("person-2") == fresh);
    assert(registry->id_to_object("person-2") == nullptr);

    auto loaded = registry->loaded_ids();
    std::sort(loaded.begin(), loaded.end());
    assert(loaded.size() == 2);
    assert(loaded[1] == "person-2");
    assert(registry->live_entries().size() == 2);

    assert(throws<resident::invalid_argument_error>([&] {
        registry->insert_entries({resident::entry::make("person-3"), nullptr});
    }));
    // Validated before anything was installed
    assert(registry->id_to_entry("person-3") == nullptr);

    std::cout << "  insert_entries test passed!" << std::endl;
}

// ============================================================================
// Test: update_entry / update_entries
// ============================================================================

void test_update_entry() {
    std::cout << "Testing update_entry..." << std::endl;

    auto registry = resident::live_registry::create();
    auto scope = registry->new_scope();

    // A freshly stored object gets mapped
    auto alice = std::make_shared<Person>(Person{"Alice", 30});
    auto e1 = resident::entry::make("person-1", {{"name", "Alice"}}, "Person");

    resident::registration_options opts;
    opts.in_storage = true;
    opts.extra = {{"dirty", false}, {"revision", 1}};
    registry->update_entry(alice, e1, opts);

    assert(registry->id_to_object("person-1") == alice);
    assert(registry->object_to_id(alice) == "person-1");
    assert(registry->object_to_entry(alice) == e1);
    assert(registry->object_in_storage(alice));

    auto info = registry->object_info_for(alice);
    assert(info.has_value());
    assert(info->extra["revision"] == 1);
    assert(info->entry == e1);

    // Later updates merge extra fields and swap the entry
    auto e2 = resident::entry::revise(e1, {{"name", "Alicia"}});
    resident::registration_options more;
    more.extra = {{"revision", 2}};
    registry->update_entry(alice, e2, more);
    info = registry->object_info_for(alice);
    assert(info->entry == e2);
    assert(info->extra["revision"] == 2);
    assert(info->extra["dirty"] == false);
    assert(info->in_storage);

    assert(throws<resident::invalid_argument_error>([&] {
        registry->update_entry(nullptr, e2);
    }));

    // Bulk form marks everything as stored
    auto rex = std::make_shared<Dog>(Dog{"Rex", 12.5});
    auto buddy = std::make_shared<Dog>(Dog{"Buddy", 20.0});
    registry->update_entries({
        {rex, resident::entry::make("dog-1", nullptr, "Dog")},
        {buddy, resident::entry::make("dog-2", nullptr, "Dog")},
    });
    assert(registry->object_in_storage(rex));
    assert(registry->object_in_storage(buddy));
    assert(registry->object_to_id(buddy) == "dog-2");
    assert(registry->id_to_entry("dog-1") != nullptr);

    // Reclaiming the object clears its id slot
    std::weak_ptr<Dog> watch = buddy;
    buddy.reset();
    scope->remove();
    assert(watch.expired());
    assert(registry->id_to_object("dog-2") == nullptr);

    std::cout << "  update_entry test passed!" << std::endl;
}

// ============================================================================
// Test: remove
// ============================================================================

void test_remove() {
    std::cout << "Testing remove..." << std::endl;

    auto registry = resident::live_registry::create();
    auto scope = registry->new_scope();

    auto alice = std::make_shared<Person>(Person{"Alice", 30});
    auto bob = std::make_shared<Person>(Person{"Bob", 40});
    auto rex = std::make_shared<Dog>(Dog{"Rex", 12.5});
    auto rex_entry = resident::entry::make("dog-1", nullptr, "Dog");

    registry->insert_pairs({
        {std::string("person-1"), alice},
        {std::string("person-2"), bob},
        {rex_entry, rex},
    });

    registry->remove({resident::object_ref(alice), std::string("dog-1"), std::string("unknown")});

    assert(registry->id_to_object("person-1") == nullptr);
    assert(!registry->object_to_id(alice).has_value());
    assert(registry->id_to_object("dog-1") == nullptr);
    assert(registry->id_to_entry("dog-1") == nullptr);
    assert(!registry->object_to_id(rex).has_value());
    assert(registry->id_to_object("person-2") == bob);

    // Removing something unknown is a no-op
    registry->remove(resident::object_ref(alice));
    registry->remove(std::string("person-1"));

    // A removed object can be registered again
    registry->register_object("person-1", alice);
    assert(registry->object_to_id(alice) == "person-1");

    std::cout << "  Remove test passed!" << std::endl;
}

// ============================================================================
// Test: clear
// ============================================================================

void test_clear() {
    std::cout << "Testing clear..." << std::endl;

    auto registry = resident::live_registry::create();
    auto scope = registry->new_scope();

    auto alice = std::make_shared<Person>(Person{"Alice", 30});
    auto e = resident::entry::make("person-1", nullptr, "Person");
    registry->insert_pairs({{e, alice}});
    registry->insert_entries({resident::entry::make("person-2")});

    registry->clear();

    assert(registry->live_ids().empty());
    assert(registry->live_objects().empty());
    assert(registry->loaded_ids().empty());
    assert(registry->id_to_object("person-1") == nullptr);
    assert(!registry->object_to_id(alice).has_value());
    assert(registry->current_scope() == nullptr);
    assert(registry->open_scope_count() == 0);

    // Objects and entries dying after clear() leave the new maps untouched
    scope.reset();
    auto next = registry->new_scope();
    registry->register_object("person-1", std::make_shared<Person>(Person{"Bob", 40}));
    alice.reset();
    e.reset();
    assert(registry->id_to_object("person-1") != nullptr);

    std::cout << "  Clear test passed!" << std::endl;
}

// ============================================================================
// Test: snapshot
// ============================================================================

void test_snapshot() {
    std::cout << "Testing snapshot..." << std::endl;

    auto registry = resident::live_registry::create(resident::configuration(true));
    auto scope = registry->new_scope();

    auto rex = std::make_shared<Dog>(Dog{"Rex", 12.5});
    auto alice = std::make_shared<Person>(Person{"Alice", 30});
    auto rex_entry = resident::entry::make("dog-1", nullptr, "Dog");

    resident::registration_options opts = resident::registration_options::pinned();
    opts.extra = {{"source", "cache"}};
    registry->register_object("person-1", alice, opts);
    registry->insert_pairs({{rex_entry, rex}});

    auto snap = registry->snapshot();
    assert(snap["openScopes"] == 1);
    assert(snap["txnDepth"] == 0);
    assert(snap["clearLeaks"] == true);

    const auto& objects = snap["objects"];
    assert(objects.size() == 2);
    assert(objects[0]["id"] == "dog-1");
    assert(objects[0]["inStorage"] == true);
    assert(objects[0]["hasEntry"] == true);
    assert(!objects[0].contains("extra"));
    assert(objects[1]["id"] == "person-1");
    assert(objects[1]["immortal"] == true);
    assert(objects[1]["extra"]["source"] == "cache");

    assert(snap["entries"].size() == 1);
    assert(snap["entries"][0] == "dog-1");

    std::cout << "  Snapshot test passed!" << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== ResidentCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        std::cout << "Testing slot guards..." << std::endl;
        guard_tests::test_guard_erases_on_destruction();
        guard_tests::test_guard_dismiss();
        guard_tests::test_guard_move();
        guard_tests::test_guard_outlives_map();

        std::cout << "Testing entries..." << std::endl;
        entry_tests::test_entry_revision_chain();
        entry_tests::test_passthrough_weaken();
        entry_tests::test_entry_json();

        // Registry tests
        test_register_and_lookup();
        test_duplicate_registration();
        test_id_reusable_after_reclaim();
        test_registration_requires_scope();
        test_entry_rejected_as_object();
        test_register_entry();
        test_register_object_and_entry();
        test_insert();
        test_insert_entries();
        test_update_entry();
        test_remove();
        test_clear();
        test_snapshot();

        std::cout << "Testing scopes..." << std::endl;
        scope_tests::test_new_scope_nesting();
        scope_tests::test_scope_keeps_objects_alive();
        scope_tests::test_nested_scope_release();
        scope_tests::test_detach_scope();
        scope_tests::test_removed_ancestor_skipped();
        scope_tests::test_scope_outlives_registry();
        scope_tests::test_dropped_scopes_leave_nothing_current();

        std::cout << "Testing transaction scopes..." << std::endl;
        transaction_tests::test_txn_nesting();
        transaction_tests::test_rollback_restores_previous_entry();
        transaction_tests::test_rollback_unregisters_new_object();
        transaction_tests::test_rollback_unwinds_newest_first();
        transaction_tests::test_rollback_chain_created_in_txn();
        transaction_tests::test_commit_hands_entries_to_parent();
        transaction_tests::test_update_entry_without_scope();

        std::cout << "Testing leak reporting..." << std::endl;
        leak_tests::test_cycle_reported_and_broken();
        leak_tests::test_clear_leaks_wipes_registry();
        leak_tests::test_immortal_not_reported();
        leak_tests::test_check_leaks_waits_for_last_scope();

        std::cout << "Testing configuration..." << std::endl;
        configuration_tests::test_configuration_from_json();
        configuration_tests::test_log_level_names();
        configuration_tests::test_registry_applies_verbosity();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
