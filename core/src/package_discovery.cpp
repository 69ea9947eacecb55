#include "grpcflow/package_discovery.hpp"
#include <sstream>
#include <stdexcept>

namespace grpcflow {

namespace {

std::vector<std::string> split_name(const std::string& name) {
    std::vector<std::string> segments;
    std::stringstream ss(name);
    std::string segment;
    while (std::getline(ss, segment, '.')) {
        segments.push_back(segment);
    }
    return segments;
}

void collect_services(const PackageNode& node, const std::string& prefix,
                      std::vector<NamedService>& out) {
    const auto* children = node.children();
    if (!children) {
        return;
    }
    for (const auto& [name, child] : *children) {
        if (!child) {
            continue;
        }
        const std::string full_name = prefix.empty() ? name : prefix + "." + name;
        if (const auto* service = child->service()) {
            out.push_back(NamedService{full_name, service});
        } else {
            collect_services(*child, full_name, out);
        }
    }
}

} // namespace

const PackageNode* lookup_package(const PackageNode* root, const std::string& package_name) {
    if (!root || package_name.empty()) {
        return nullptr;
    }
    const PackageNode* current = root;
    for (const auto& segment : split_name(package_name)) {
        const auto* children = current->children();
        if (!children) {
            return nullptr;
        }
        auto it = children->find(segment);
        if (it == children->end() || !it->second) {
            return nullptr;
        }
        current = it->second.get();
    }
    return current->is_service() ? nullptr : current;
}

std::vector<NamedService> get_service_names(const PackageNode* node) {
    std::vector<NamedService> services;
    if (node) {
        collect_services(*node, "", services);
    }
    return services;
}

void add_service(PackageNode& root, const std::string& full_name, ServiceDefinition definition) {
    auto segments = split_name(full_name);
    if (segments.empty()) {
        throw std::invalid_argument("Empty service name");
    }

    PackageNode* current = &root;
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        auto* children = current->mutable_children();
        if (!children) {
            throw std::invalid_argument("Namespace " + segments[i] + " of " + full_name +
                                        " collides with a service");
        }
        auto& child = (*children)[segments[i]];
        if (!child) {
            child = PackageNode::make_namespace();
        }
        current = child.get();
    }

    auto* children = current->mutable_children();
    if (!children) {
        throw std::invalid_argument("Parent of " + full_name + " is a service");
    }
    auto& leaf = (*children)[segments.back()];
    if (leaf && !leaf->is_service()) {
        throw std::invalid_argument("Service " + full_name + " collides with a namespace");
    }
    leaf = PackageNode::make_service(std::move(definition));
}

} // namespace grpcflow
