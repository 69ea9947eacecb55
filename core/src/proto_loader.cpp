#include "grpcflow/proto_loader.hpp"
#include "grpcflow/errors.hpp"
#include <google/protobuf/compiler/importer.h>
#include <glog/logging.h>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>

namespace grpcflow {

namespace {

using google::protobuf::DescriptorPool;
using google::protobuf::FileDescriptor;
using google::protobuf::FileDescriptorProto;

// Collects BuildFile errors so they can be reported with the file name
class LoaderErrorCollector : public DescriptorPool::ErrorCollector {
public:
    void AddError(const std::string& filename, const std::string& element_name,
                  const google::protobuf::Message*, ErrorLocation,
                  const std::string& message) override {
        if (!errors_.empty()) {
            errors_ += "; ";
        }
        errors_ += filename + ": " + element_name + ": " + message;
    }

    const std::string& errors() const { return errors_; }

private:
    std::string errors_;
};

// Collects parser errors of every file reached by one import
class ImportErrorCollector : public google::protobuf::compiler::MultiFileErrorCollector {
public:
    void AddError(const std::string& filename, int line, int column, const std::string& message) override {
        if (!errors_.empty()) {
            errors_ += "; ";
        }
        errors_ += filename + ":" + std::to_string(line + 1) + ":" + std::to_string(column + 1) + ": " + message;
    }

    void AddWarning(const std::string& filename, int line, int column, const std::string& message) override {
        LOG(WARNING) << filename << ":" << line + 1 << ":" << column + 1 << ": " << message;
    }

    const std::string& errors() const { return errors_; }

private:
    std::string errors_;
};

// Appends file after its imports, each file once
void collect_with_dependencies(const FileDescriptor* file,
                               std::set<std::string>& seen,
                               std::vector<FileDescriptorProto>& files) {
    if (!seen.insert(file->name()).second) {
        return;
    }
    for (int i = 0; i < file->dependency_count(); ++i) {
        collect_with_dependencies(file->dependency(i), seen, files);
    }
    FileDescriptorProto proto;
    file->CopyTo(&proto);
    file->CopyJsonNameTo(&proto);
    files.push_back(std::move(proto));
}

} // namespace

class ProtoLoaderImpl : public ProtoLoader {
public:
    LoadedProto load(const std::vector<std::string>& descriptor_set_paths) override {
        std::vector<FileDescriptorProto> files;
        for (const auto& path : descriptor_set_paths) {
            auto set_files = read_descriptor_set(path);
            files.insert(files.end(), set_files.begin(), set_files.end());
        }
        return load_files(files);
    }

    LoadedProto load_files(const std::vector<FileDescriptorProto>& files) override {
        LoadedProto loaded;
        loaded.pool = std::make_shared<DescriptorPool>();
        loaded.root = PackageNode::make_namespace();

        std::map<std::string, const FileDescriptorProto*> by_name;
        for (const auto& file : files) {
            by_name.emplace(file.name(), &file);
        }

        std::set<std::string> in_progress;
        for (const auto& [name, file] : by_name) {
            const auto* descriptor = build_file(*loaded.pool, by_name, name, in_progress);
            for (int i = 0; i < descriptor->service_count(); ++i) {
                const auto* service = descriptor->service(i);
                add_service(*loaded.root, service->full_name(), service_definition_from_descriptor(*service));
                LOG(INFO) << "Loaded service " << service->full_name() << " with "
                          << service->method_count() << " methods from " << name;
            }
        }
        return loaded;
    }

    LoadedProto load_proto_files(const std::vector<std::string>& paths,
                                 const std::vector<std::string>& include_dirs) override {
        return load_files(read_proto_files(paths, include_dirs));
    }

    std::vector<FileDescriptorProto> read_proto_files(const std::vector<std::string>& paths,
                                                      const std::vector<std::string>& include_dirs) override {
        using google::protobuf::compiler::DiskSourceTree;

        DiskSourceTree source_tree;
        for (const auto& dir : include_dirs) {
            source_tree.MapPath("", dir);
        }

        // Resolve every path to its name inside the source tree before
        // importing, mapping its directory when no include dir covers it
        std::vector<std::pair<std::string, std::string>> virtual_files;
        for (const auto& path : paths) {
            std::string virtual_file;
            std::string shadowing_file;
            auto result = source_tree.DiskFileToVirtualFile(path, &virtual_file, &shadowing_file);
            if (result == DiskSourceTree::NO_MAPPING) {
                auto parent = std::filesystem::path(path).parent_path().string();
                source_tree.MapPath("", parent.empty() ? "." : parent);
                result = source_tree.DiskFileToVirtualFile(path, &virtual_file, &shadowing_file);
            }
            if (result == DiskSourceTree::CANNOT_OPEN || result == DiskSourceTree::NO_MAPPING) {
                LOG(ERROR) << "Cannot open proto file " << path;
                throw InvalidProtoDefinitionError(path, "cannot open file");
            }
            if (result == DiskSourceTree::SHADOWED) {
                throw InvalidProtoDefinitionError(path, "shadowed by " + shadowing_file);
            }
            virtual_files.emplace_back(path, virtual_file);
        }

        ImportErrorCollector errors;
        google::protobuf::compiler::Importer importer(&source_tree, &errors);
        std::set<std::string> seen;
        std::vector<FileDescriptorProto> files;
        for (const auto& [path, virtual_file] : virtual_files) {
            const auto* file = importer.Import(virtual_file);
            if (!file) {
                LOG(ERROR) << "Failed to parse " << path << ": " << errors.errors();
                throw InvalidProtoDefinitionError(path, errors.errors());
            }
            collect_with_dependencies(file, seen, files);
        }
        VLOG(1) << "Parsed " << files.size() << " files from " << paths.size() << " proto paths";
        return files;
    }

    std::vector<FileDescriptorProto> read_descriptor_set(const std::string& path) override {
        std::ifstream input(path, std::ios::binary);
        if (!input) {
            LOG(ERROR) << "Cannot open descriptor set " << path;
            throw InvalidProtoDefinitionError(path, "cannot open file");
        }
        google::protobuf::FileDescriptorSet set;
        if (!set.ParseFromIstream(&input)) {
            LOG(ERROR) << "Cannot parse descriptor set " << path;
            throw InvalidProtoDefinitionError(path, "not a serialized FileDescriptorSet");
        }
        VLOG(1) << "Read " << set.file_size() << " files from " << path;
        return std::vector<FileDescriptorProto>(set.file().begin(), set.file().end());
    }

private:
    // Builds name after its dependencies
    const FileDescriptor* build_file(DescriptorPool& pool,
                                     const std::map<std::string, const FileDescriptorProto*>& by_name,
                                     const std::string& name,
                                     std::set<std::string>& in_progress) {
        if (const auto* existing = pool.FindFileByName(name)) {
            return existing;
        }
        auto it = by_name.find(name);
        if (it == by_name.end()) {
            throw InvalidProtoDefinitionError(name, "missing dependency");
        }
        if (!in_progress.insert(name).second) {
            throw InvalidProtoDefinitionError(name, "import cycle");
        }
        for (const auto& dependency : it->second->dependency()) {
            build_file(pool, by_name, dependency, in_progress);
        }
        in_progress.erase(name);

        LoaderErrorCollector errors;
        const auto* descriptor = pool.BuildFileCollectingErrors(*it->second, &errors);
        if (!descriptor) {
            LOG(ERROR) << "Failed to build " << name << ": " << errors.errors();
            throw InvalidProtoDefinitionError(name, errors.errors());
        }
        return descriptor;
    }
};

std::unique_ptr<ProtoLoader> ProtoLoader::create() {
    return std::make_unique<ProtoLoaderImpl>();
}

ServiceDefinition service_definition_from_descriptor(const google::protobuf::ServiceDescriptor& service) {
    ServiceDefinition definition;
    definition.full_name = service.full_name();
    for (int i = 0; i < service.method_count(); ++i) {
        const auto* method = service.method(i);
        MethodDescriptor descriptor;
        descriptor.method_name = method->name();
        descriptor.original_name = to_original_name(method->name());
        descriptor.path = "/" + service.full_name() + "/" + method->name();
        descriptor.request_streaming = method->client_streaming();
        descriptor.response_streaming = method->server_streaming();
        descriptor.request_type = method->input_type()->full_name();
        descriptor.response_type = method->output_type()->full_name();
        definition.methods.emplace(descriptor.method_name, std::move(descriptor));
    }
    return definition;
}

std::string to_original_name(const std::string& method_name) {
    std::string result;
    result.reserve(method_name.size());

    // Leading run of capitals is lowered, except the last one when it starts
    // a capitalized word ("HTTPRequest" -> "httpRequest")
    std::size_t i = 0;
    while (i < method_name.size() && std::isupper(static_cast<unsigned char>(method_name[i]))) {
        const bool next_is_lower = i + 1 < method_name.size() &&
                                   std::islower(static_cast<unsigned char>(method_name[i + 1]));
        if (i > 0 && next_is_lower) {
            break;
        }
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(method_name[i])));
        ++i;
    }

    bool upper_next = false;
    for (; i < method_name.size(); ++i) {
        const char c = method_name[i];
        if (c == '_') {
            upper_next = !result.empty();
            continue;
        }
        if (upper_next) {
            result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            upper_next = false;
        } else if (result.empty()) {
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            result += c;
        }
    }
    return result;
}

} // namespace grpcflow
