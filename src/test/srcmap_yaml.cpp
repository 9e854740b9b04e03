// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "printing.hpp"
#include "srcmap.hpp"
#include "test/srcmap_yaml.hpp"

using std::string;
using std::vector;

namespace srcmap {

struct RawTestCase {
    string test_case;
    std::optional<string> expected_exception;
    std::set<string> options;
    vector<string> sources;
    vector<string> names;
    string mappings;
    vector<string> index;
    std::optional<string> encoded;
};

static vector<string> as_vector_empty_default(const YAML::Node& optional_node) {
    if (!optional_node.IsDefined() || optional_node.IsNull()) {
        return {};
    }
    return optional_node.as<vector<string>>();
}

static std::set<string> as_set_empty_default(const YAML::Node& optional_node) {
    const vector<string> items = as_vector_empty_default(optional_node);
    return {items.begin(), items.end()};
}

static std::optional<string> as_optional_string(const YAML::Node& optional_node) {
    if (!optional_node.IsDefined() || optional_node.IsNull()) {
        return std::nullopt;
    }
    return optional_node.as<string>();
}

static RawTestCase parse_case(const YAML::Node& case_node) {
    return RawTestCase{
        .test_case = case_node["test-case"].as<string>(),
        .expected_exception = as_optional_string(case_node["expected-exception"]),
        .options = as_set_empty_default(case_node["options"]),
        .sources = as_vector_empty_default(case_node["sources"]),
        .names = as_vector_empty_default(case_node["names"]),
        .mappings = case_node["mappings"].as<string>(),
        .index = as_vector_empty_default(case_node["index"]),
        .encoded = as_optional_string(case_node["encoded"]),
    };
}

static srcmap_options_t raw_options_to_options(const std::set<string>& raw_options) {
    srcmap_options_t options{};
    for (const string& name : raw_options) {
        if (name == "allow_unmapped") {
            options.decode_opts.allow_unmapped_segments = true;
        } else if (name == "!sort") {
            options.encode_opts.sort_segments = false;
        } else {
            throw std::runtime_error("Unknown option: " + name);
        }
    }
    return options;
}

static TestCase read_case(const RawTestCase& raw_case) {
    return TestCase{
        .name = raw_case.test_case,
        .options = raw_options_to_options(raw_case.options),
        .sources = raw_case.sources,
        .names = raw_case.names,
        .mappings = raw_case.mappings,
        .expected_index = raw_case.index,
        .expected_encoding = raw_case.encoded,
        .expected_exception = raw_case.expected_exception,
    };
}

static vector<TestCase> read_suite(const string& path) {
    std::ifstream f{path};
    if (!f) {
        throw std::runtime_error("Cannot open test suite " + path);
    }
    vector<TestCase> res;
    for (const YAML::Node& config : YAML::LoadAll(f)) {
        res.push_back(read_case(parse_case(config)));
    }
    return res;
}

// Lines present in actual but not in expected, and the reverse. Multiplicity counts.
static Diff<vector<string>> make_diff(vector<string> actual, vector<string> expected) {
    std::ranges::sort(actual);
    std::ranges::sort(expected);
    Diff<vector<string>> res;
    std::ranges::set_difference(actual, expected, std::back_inserter(res.unexpected));
    std::ranges::set_difference(expected, actual, std::back_inserter(res.unseen));
    return res;
}

static Diff<std::set<string>> make_diff(const std::set<string>& actual, const std::set<string>& expected) {
    Diff<std::set<string>> res;
    std::ranges::set_difference(actual, expected, std::inserter(res.unexpected, res.unexpected.end()));
    std::ranges::set_difference(expected, actual, std::inserter(res.unseen, res.unseen.end()));
    return res;
}

std::optional<Failure> run_yaml_test_case(const TestCase& test_case, const bool debug) {
    std::set<string> expected_messages;
    if (test_case.expected_exception) {
        expected_messages.insert("Exception: " + *test_case.expected_exception);
    }
    if (test_case.expected_encoding) {
        expected_messages.insert("Encoded: " + *test_case.expected_encoding);
    }

    vector<string> actual_index;
    std::set<string> actual_messages;
    try {
        const PositionIndex index =
            decode(test_case.mappings, test_case.sources, test_case.names, test_case.options.decode_opts);
        if (debug) {
            std::cout << index;
        }
        actual_index = to_strings(index);
        if (test_case.expected_encoding) {
            vector<string> names;
            actual_messages.insert("Encoded: " + encode_mappings(index, names, test_case.options.encode_opts));
        }
    } catch (const std::exception& ex) {
        actual_messages.insert(string{"Exception: "} + ex.what());
    }

    // Iteration order is part of the contract, not just the contents.
    if (actual_index != test_case.expected_index && std::ranges::is_permutation(actual_index, test_case.expected_index)) {
        actual_messages.insert("Index order differs");
    }

    if (actual_index == test_case.expected_index && actual_messages == expected_messages) {
        return {};
    }
    return Failure{
        .index = make_diff(actual_index, test_case.expected_index),
        .messages = make_diff(actual_messages, expected_messages),
    };
}

void print_failure(const Failure& failure, std::ostream& os) {
    constexpr auto INDENT = "  ";
    if (!failure.index.unexpected.empty()) {
        os << "Unexpected positions:\n";
        for (const auto& item : failure.index.unexpected) {
            os << INDENT << item << "\n";
        }
    } else {
        os << "Unexpected positions: None\n";
    }
    if (!failure.index.unseen.empty()) {
        os << "Unseen positions:\n";
        for (const auto& item : failure.index.unseen) {
            os << INDENT << item << "\n";
        }
    } else {
        os << "Unseen positions: None\n";
    }

    if (!failure.messages.unexpected.empty()) {
        os << "Unexpected messages:\n";
        for (const auto& item : failure.messages.unexpected) {
            os << INDENT << item << "\n";
        }
    } else {
        os << "Unexpected messages: None\n";
    }

    if (!failure.messages.unseen.empty()) {
        os << "Unseen messages:\n";
        for (const auto& item : failure.messages.unseen) {
            os << INDENT << item << "\n";
        }
    } else {
        os << "Unseen messages: None\n";
    }
}

void foreach_suite(const string& path, const std::function<void(const TestCase&)>& f) {
    for (const TestCase& test_case : read_suite(path)) {
        f(test_case);
    }
}
} // namespace srcmap
