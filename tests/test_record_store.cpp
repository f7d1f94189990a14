#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "record_store.hpp"

namespace {

using ipam::DatabaseConfig;
using ipam::PortRangeConfig;
using ipam::RecordStore;

DatabaseConfig memory_database() {
    DatabaseConfig database;
    database.path = ":memory:";
    return database;
}

PortRangeConfig make_ports(int min, int max, int max_tries) {
    PortRangeConfig ports;
    ports.min = min;
    ports.max = max;
    ports.max_tries = max_tries;
    return ports;
}

// Hands out the given ports in order, then repeats the last one
RecordStore::PortPicker scripted_picker(std::vector<uint16_t> ports, int& calls) {
    return [ports, &calls]() {
        size_t index = static_cast<size_t>(calls);
        ++calls;
        return ports[index < ports.size() ? index : ports.size() - 1];
    };
}

void test_add_and_get_record() {
    RecordStore records(memory_database(), make_ports(50000, 50100, 100));

    uint16_t conn_port = records.addRecord("10.0.0.5", 22, "vm1", "lab");
    assert(conn_port >= 50000 && conn_port <= 50100);

    auto [target_port, target_addr] = records.getRecord(conn_port);
    assert(target_port == 22);
    assert(target_addr == "10.0.0.5");

    uint16_t other_port = conn_port == 50000 ? 50001 : 50000;
    auto [missing_port, missing_addr] = records.getRecord(other_port);
    assert(!missing_port.has_value());
    assert(!missing_addr.has_value());
}

void test_collision_retries_with_next_port() {
    int calls = 0;
    RecordStore records(memory_database(), make_ports(50000, 50100, 100),
                        scripted_picker({50005, 50006}, calls));

    assert(records.addRecord("10.0.0.5", 22, "vm1", "lab") == 50005);
    assert(calls == 1);

    // The first candidate collides with the existing row, the second is free
    calls = 0;
    assert(records.addRecord("10.0.0.6", 22, "vm2", "lab") == 50006);
    assert(calls == 2);
    assert(records.lookupByFilter({}).size() == 2);
}

void test_exhaustion_raises_capacity_exhausted() {
    int calls = 0;
    RecordStore records(memory_database(), make_ports(50000, 50100, 5),
                        scripted_picker({50007}, calls));
    records.addRecord("10.0.0.5", 22, "vm1", "lab");

    calls = 0;
    bool threw = false;
    try {
        records.addRecord("10.0.0.6", 22, "vm2", "lab");
    } catch (const ipam::CapacityExhausted& e) {
        threw = true;
        assert(std::string(e.what()) == "Failed to create port map after 5 tries");
    }
    assert(threw);
    assert(calls == 5);
}

void test_full_range_is_exhausted() {
    RecordStore records(memory_database(), make_ports(50000, 50001, 50));
    std::set<uint16_t> allocated;
    allocated.insert(records.addRecord("10.0.0.1", 22, "a", "lab"));
    allocated.insert(records.addRecord("10.0.0.2", 22, "b", "lab"));
    assert(allocated.size() == 2);

    bool threw = false;
    try {
        records.addRecord("10.0.0.3", 22, "c", "lab");
    } catch (const ipam::CapacityExhausted&) {
        threw = true;
    }
    assert(threw);
}

void test_other_store_errors_are_not_retried() {
    int calls = 0;
    RecordStore records(memory_database(), make_ports(50000, 50100, 10),
                        scripted_picker({50008}, calls));
    records.execute("DROP TABLE ipam;");

    bool threw = false;
    try {
        records.addRecord("10.0.0.5", 22, "vm1", "lab");
    } catch (const ipam::CapacityExhausted&) {
        assert(false);
    } catch (const ipam::StoreError& e) {
        threw = true;
        assert(!e.isUniqueViolation());
    }
    assert(threw);
    assert(calls == 1);
}

void test_delete_record_is_idempotent() {
    int calls = 0;
    RecordStore records(memory_database(), make_ports(50000, 50100, 10),
                        scripted_picker({50009}, calls));
    records.addRecord("10.0.0.5", 22, "vm1", "lab");

    records.deleteRecord(50009);
    assert(!records.getRecord(50009).first.has_value());

    // Deleting an absent record is not an error
    records.deleteRecord(50009);
    records.deleteRecord(60000);
}

void test_lookup_by_filter() {
    int calls = 0;
    RecordStore records(memory_database(), make_ports(50000, 50100, 10),
                        scripted_picker({50010, 50011, 50012}, calls));
    records.addRecord("10.0.0.5", 22, "vm1", "lab");
    records.addRecord("10.0.0.5", 3389, "vm1", "lab");
    records.addRecord("10.0.0.6", 22, "vm2", "router");

    assert(records.lookupByFilter({}).size() == 3);

    ipam::RecordFilter by_name;
    by_name.name = "vm1";
    auto vm1 = records.lookupByFilter(by_name);
    assert(vm1.size() == 2);
    assert(vm1.at(50011).target_port == 3389);
    assert(!vm1.at(50011).routable.has_value());

    ipam::RecordFilter combined;
    combined.addr = "10.0.0.5";
    combined.target_port = 22;
    auto ssh = records.lookupByFilter(combined);
    assert(ssh.size() == 1);
    assert(ssh.begin()->first == 50010);
    assert(ssh.begin()->second.target_component == "lab");

    ipam::RecordFilter by_conn_port;
    by_conn_port.conn_port = 50012;
    assert(records.lookupByFilter(by_conn_port).at(50012).target_name == "vm2");

    ipam::RecordFilter nothing;
    nothing.component = "storage";
    assert(records.lookupByFilter(nothing).empty());
}

void test_lookup_addresses_and_routable() {
    int calls = 0;
    RecordStore records(memory_database(), make_ports(50000, 50100, 10),
                        scripted_picker({50020, 50021, 50022, 50023}, calls));
    records.addRecord("10.0.0.5", 22, "vm1", "lab");
    records.addRecord("10.0.1.5", 22, "vm1", "lab");
    records.addRecord("10.0.0.5", 80, "vm1", "lab");
    records.addRecord("10.0.0.6", 22, "vm2", "router");

    auto targets = records.listTargets();
    assert(targets.size() == 3);
    assert(targets[0] == std::make_pair(std::string("vm1"), std::string("10.0.0.5")));

    auto machines = records.lookupAddresses({});
    assert(machines.size() == 2);
    assert((machines.at("vm1").addrs == std::vector<std::string>{"10.0.0.5", "10.0.1.5"}));
    assert(machines.at("vm1").component == "lab");
    assert(!machines.at("vm1").routable.has_value());

    records.setRoutable("vm1", "10.0.0.5", true);
    assert(records.lookupAddresses({}).at("vm1").routable == true);

    records.setRoutable("vm1", "10.0.1.5", false);
    assert(records.lookupAddresses({}).at("vm1").routable == false);

    records.setRoutable("vm1", "10.0.1.5", true);
    assert(records.lookupAddresses({}).at("vm1").routable == true);

    ipam::AddressFilter by_component;
    by_component.component = "router";
    auto routers = records.lookupAddresses(by_component);
    assert(routers.size() == 1);
    assert(routers.at("vm2").addrs.size() == 1);

    ipam::AddressFilter by_addr;
    by_addr.addr = "10.0.1.5";
    assert(records.lookupAddresses(by_addr).at("vm1").addrs.size() == 1);
}

void test_parameters_are_not_interpolated() {
    RecordStore records(memory_database(), make_ports(50000, 50100, 10));
    uint16_t conn_port = records.addRecord("10.0.0.5", 22, "vm'); DROP TABLE ipam; --", "lab");

    ipam::RecordFilter filter;
    filter.name = "vm'); DROP TABLE ipam; --";
    assert(records.lookupByFilter(filter).count(conn_port) == 1);
}

void test_invalid_port_range() {
    bool threw = false;
    try {
        RecordStore records(memory_database(), make_ports(50100, 50000, 10));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

void test_unopenable_database() {
    DatabaseConfig database;
    database.path = "/nonexistent-ipam-portmap-dir/ipam.db";

    bool threw = false;
    try {
        RecordStore records(database, make_ports(50000, 50100, 10));
    } catch (const ipam::StoreError& e) {
        threw = true;
        assert(!e.isUniqueViolation());
    }
    assert(threw);
}

} // namespace

int main() {
    ipam::Logger::setLevel(ipam::LogLevel::None);

    test_add_and_get_record();
    test_collision_retries_with_next_port();
    test_exhaustion_raises_capacity_exhausted();
    test_full_range_is_exhausted();
    test_other_store_errors_are_not_retried();
    test_delete_record_is_idempotent();
    test_lookup_by_filter();
    test_lookup_addresses_and_routable();
    test_parameters_are_not_interpolated();
    test_invalid_port_range();
    test_unopenable_database();

    std::cout << "record store tests passed\n";
    return 0;
}
