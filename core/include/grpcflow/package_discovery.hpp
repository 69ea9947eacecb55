#pragma once

#include "grpcflow/types.hpp"
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace grpcflow {

struct PackageNode;

using PackageChildren = std::map<std::string, std::shared_ptr<PackageNode>>;

// Node of a loaded namespace tree: either a namespace with named children
// or a service definition leaf
struct PackageNode {
    std::variant<PackageChildren, ServiceDefinition> content;

    static std::shared_ptr<PackageNode> make_namespace() {
        auto node = std::make_shared<PackageNode>();
        node->content = PackageChildren{};
        return node;
    }

    static std::shared_ptr<PackageNode> make_service(ServiceDefinition definition) {
        auto node = std::make_shared<PackageNode>();
        node->content = std::move(definition);
        return node;
    }

    bool is_service() const { return std::holds_alternative<ServiceDefinition>(content); }

    // Null for a namespace node
    const ServiceDefinition* service() const { return std::get_if<ServiceDefinition>(&content); }

    // Null for a service node
    const PackageChildren* children() const { return std::get_if<PackageChildren>(&content); }
    PackageChildren* mutable_children() { return std::get_if<PackageChildren>(&content); }
};

struct NamedService {
    std::string name;   // Dotted, relative to the node the walk started at
    const ServiceDefinition* service;
};

// Resolve a dotted package name ("a.b.c") below root. Returns null when a
// segment is missing or names a service.
const PackageNode* lookup_package(const PackageNode* root, const std::string& package_name);

// Every service definition below node, in lexicographic order of the tree
std::vector<NamedService> get_service_names(const PackageNode* node);

// Insert a service under its fully qualified dotted name, creating
// namespaces on the way. Throws std::invalid_argument when a segment is
// already taken by a node of the other kind.
void add_service(PackageNode& root, const std::string& full_name, ServiceDefinition definition);

} // namespace grpcflow
