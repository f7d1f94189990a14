#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>

#include "errors.hpp"
#include "fake_iptables.hpp"
#include "logger.hpp"
#include "rule_store.hpp"

namespace {

using ipam::FirewallConfig;
using ipam::RuleStore;

std::string temp_rules_file() {
    return (std::filesystem::temp_directory_path() /
            ("ipam-portmap-rules-" + std::to_string(getpid()) + ".v4")).string();
}

FirewallConfig make_config() {
    FirewallConfig config;
    config.external_interface = "eth1";
    config.rules_file = temp_rules_file();
    config.use_sudo = true;
    return config;
}

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

void test_command_forms() {
    auto iptables = std::make_shared<FakeIptables>();
    RuleStore rules(make_config(), iptables);

    auto forward_id = rules.forward("192.168.1.2", 22);
    assert(forward_id == "3");
    const auto& append_forward = iptables->history().front();
    assert((append_forward == FakeIptables::Args{"iptables", "-A", "FORWARD", "-p", "tcp", "-d",
                                                  "192.168.1.2", "--dport", "22", "-j", "ACCEPT"}));

    auto nat_id = rules.prerouting(6000, "192.168.1.2", 22);
    assert(nat_id == "1");
    bool found_prerouting = false;
    for (const auto& args : iptables->history()) {
        if (args == FakeIptables::Args{"iptables", "-A", "PREROUTING", "-t", "nat", "-i", "eth1",
                                       "-p", "tcp", "--dport", "6000", "-j", "DNAT",
                                       "--to", "192.168.1.2:22"}) {
            found_prerouting = true;
        }
    }
    assert(found_prerouting);

    bool found_listing = false;
    for (const auto& args : iptables->history()) {
        if (args == FakeIptables::Args{"iptables", "--numeric", "-L", "PREROUTING", "-t", "nat",
                                       "--line-numbers"}) {
            found_listing = true;
        }
    }
    assert(found_listing);

    rules.deleteRule(nat_id, "nat");
    assert((iptables->history().back() ==
            FakeIptables::Args{"iptables", "-t", "nat", "-D", "PREROUTING", "1"}));

    // Every command went through sudo
    assert(iptables->sudoCalls() == static_cast<int>(iptables->history().size()));
}

void test_without_sudo() {
    auto iptables = std::make_shared<FakeIptables>();
    FirewallConfig config = make_config();
    config.use_sudo = false;
    RuleStore rules(config, iptables);

    rules.show("filter");
    assert(iptables->sudoCalls() == 0);
}

void test_find_rule() {
    auto iptables = std::make_shared<FakeIptables>();
    RuleStore rules(make_config(), iptables);
    iptables->addForward("10.0.0.5", 22);
    iptables->addForward("10.0.0.6", 22);
    iptables->addNat(50001, "10.0.0.5", 22);
    iptables->addNat(50002, "10.0.0.6", 22);

    assert(rules.findRule("10.0.0.6", 22, "filter") == "4");
    assert(rules.findRule("10.0.0.6", 22, "nat", 50002) == "2");
    // Table names are case-insensitive
    assert(rules.findRule("10.0.0.5", 22, "NAT", 50001) == "1");
    // conn_port is ignored for FORWARD rules
    assert(rules.findRule("10.0.0.5", 22, "filter", 50001) == "3");

    bool threw = false;
    try {
        rules.findRule("10.0.0.5", 22, "nat");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        rules.findRule("10.0.0.5", 22, "mangle", 50001);
    } catch (const std::invalid_argument& e) {
        threw = true;
        assert(std::string(e.what()) ==
               "Param \"table\" must be either \"nat\" or \"filter\", supplied: mangle");
    }
    assert(threw);

    threw = false;
    try {
        rules.findRule("10.0.0.9", 22, "nat", 50009);
    } catch (const ipam::RuleNotFound&) {
        threw = true;
    }
    assert(threw);
}

void test_find_rule_returns_first_of_duplicates() {
    auto iptables = std::make_shared<FakeIptables>();
    RuleStore rules(make_config(), iptables);
    iptables->addForward("10.0.0.5", 22);
    iptables->addForward("10.0.0.5", 22);

    assert(rules.findRule("10.0.0.5", 22, "filter") == "3");
    // A freshly appended duplicate is located at the end of the chain
    assert(rules.forward("10.0.0.5", 22) == "5");
}

void test_delete_rule_errors() {
    auto iptables = std::make_shared<FakeIptables>();
    RuleStore rules(make_config(), iptables);

    bool threw = false;
    try {
        rules.deleteRule("1", "raw");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        rules.deleteRule("1; reboot", "nat");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(iptables->history().empty());

    // No rule at that position
    threw = false;
    try {
        rules.deleteRule("7", "nat");
    } catch (const ipam::CommandError& e) {
        threw = true;
        assert(e.result().exit_code == 1);
    }
    assert(threw);
}

void test_map_port_creates_both_rules_and_saves() {
    auto iptables = std::make_shared<FakeIptables>();
    FirewallConfig config = make_config();
    RuleStore rules(config, iptables);

    auto [forward_id, prerouting_id] = rules.mapPort(50010, 22, "10.0.0.5");
    assert(forward_id == "3");
    assert(prerouting_id == "1");
    assert(iptables->nat().size() == 1);
    assert(iptables->forwardRules().size() == 1);
    assert(iptables->count(FakeIptables::isSave()) == 1);

    std::string saved = read_file(config.rules_file);
    assert(saved.find("--dport 50010 -j DNAT --to-destination 10.0.0.5:22") != std::string::npos);
    assert(saved.back() == '\n');
    std::filesystem::remove(config.rules_file);
}

void test_map_port_removes_forward_rule_when_nat_fails() {
    auto iptables = std::make_shared<FakeIptables>();
    RuleStore rules(make_config(), iptables);
    iptables->failWhen(FakeIptables::isAppend("PREROUTING"));

    bool threw = false;
    try {
        rules.mapPort(50011, 22, "10.0.0.5");
    } catch (const ipam::CommandError&) {
        threw = true;
    }
    assert(threw);
    assert(iptables->count(FakeIptables::isDelete("filter")) == 1);
    assert(iptables->count(FakeIptables::isDelete("nat")) == 0);
    assert(iptables->forwardRules().empty());
    assert(iptables->nat().empty());
    assert(iptables->count(FakeIptables::isSave()) == 0);
}

void test_map_port_removes_rules_when_save_fails() {
    auto iptables = std::make_shared<FakeIptables>();
    RuleStore rules(make_config(), iptables);
    iptables->failWhen(FakeIptables::isSave());

    bool threw = false;
    try {
        rules.mapPort(50012, 22, "10.0.0.5");
    } catch (const ipam::CommandError&) {
        threw = true;
    }
    assert(threw);
    assert(iptables->forwardRules().empty());
    assert(iptables->nat().empty());
}

void test_map_port_removes_forward_rule_when_nat_removal_fails() {
    auto iptables = std::make_shared<FakeIptables>();
    RuleStore rules(make_config(), iptables);
    auto fail_save = FakeIptables::isSave();
    auto fail_nat_delete = FakeIptables::isDelete("nat");
    iptables->failWhen([fail_save, fail_nat_delete](const FakeIptables::Args& args) {
        return fail_save(args) || fail_nat_delete(args);
    });

    bool threw = false;
    try {
        rules.mapPort(50013, 22, "10.0.0.5");
    } catch (const ipam::CommandError& e) {
        threw = true;
        assert(e.result().command == "iptables-save");
    }
    assert(threw);
    assert(iptables->count(FakeIptables::isDelete("nat")) == 1);
    assert(iptables->count(FakeIptables::isDelete("filter")) == 1);
    assert(iptables->nat().size() == 1);
    assert(iptables->forwardRules().empty());
}

void test_save_rules_unwritable_file() {
    auto iptables = std::make_shared<FakeIptables>();
    FirewallConfig config = make_config();
    config.rules_file = "/nonexistent-ipam-portmap-dir/rules.v4";
    RuleStore rules(config, iptables);

    bool threw = false;
    try {
        rules.saveRules();
    } catch (const std::runtime_error& e) {
        threw = true;
        assert(std::string(e.what()).find("rules.v4") != std::string::npos);
    }
    assert(threw);
}

void test_show_and_raw() {
    auto iptables = std::make_shared<FakeIptables>();
    RuleStore rules(make_config(), iptables);
    iptables->addNat(50020, "10.0.0.5", 22);
    iptables->addForward("10.0.0.5", 22);

    auto nat = rules.show("nat");
    assert(nat.size() == 1);
    assert(nat[0].conn_port == 50020);

    auto filter = rules.show("filter");
    assert(filter.size() == 1);
    assert(filter[0].position == "3");

    std::string raw = rules.showRaw("filter");
    assert(raw.find("Chain FORWARD") == 0);

    iptables->failWhen(FakeIptables::isList());
    bool threw = false;
    try {
        rules.show("nat");
    } catch (const ipam::CommandError&) {
        threw = true;
    }
    assert(threw);
}

void test_guard_is_reentrant() {
    auto iptables = std::make_shared<FakeIptables>();
    RuleStore rules(make_config(), iptables);
    iptables->addNat(50030, "10.0.0.5", 22);
    iptables->addForward("10.0.0.5", 22);

    std::lock_guard<RuleStore> guard(rules);
    auto nat_id = rules.findRule("10.0.0.5", 22, "nat", 50030);
    auto filter_id = rules.findRule("10.0.0.5", 22, "filter");
    rules.deleteRule(nat_id, "nat");
    rules.deleteRule(filter_id, "filter");
    assert(iptables->nat().empty());
    assert(iptables->forwardRules().empty());
}

void test_guard_blocks_other_threads() {
    auto iptables = std::make_shared<FakeIptables>();
    RuleStore rules(make_config(), iptables);

    std::atomic<bool> started{false};
    std::thread other;
    {
        std::lock_guard<RuleStore> guard(rules);
        other = std::thread([&rules, &started]() {
            started = true;
            rules.forward("10.0.0.7", 22);
        });
        while (!started) {
            std::this_thread::yield();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        // No command runs while the guard is held elsewhere
        assert(iptables->history().empty());
    }
    other.join();

    assert(iptables->count(FakeIptables::isAppend("FORWARD")) == 1);
    assert(iptables->forwardRules().size() == 1);
    assert(iptables->forwardRules()[0].addr == "10.0.0.7");
}

void test_requires_runner() {
    bool threw = false;
    try {
        RuleStore rules(make_config(), nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main() {
    ipam::Logger::setLevel(ipam::LogLevel::None);

    test_command_forms();
    test_without_sudo();
    test_find_rule();
    test_find_rule_returns_first_of_duplicates();
    test_delete_rule_errors();
    test_map_port_creates_both_rules_and_saves();
    test_map_port_removes_forward_rule_when_nat_fails();
    test_map_port_removes_rules_when_save_fails();
    test_map_port_removes_forward_rule_when_nat_removal_fails();
    test_save_rules_unwritable_file();
    test_show_and_raw();
    test_guard_is_reentrant();
    test_guard_blocks_other_threads();
    test_requires_runner();

    std::cout << "rule store tests passed\n";
    return 0;
}
