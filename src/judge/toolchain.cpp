#include "judge/toolchain.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/replace.hpp>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

bool toolchain_spec::needs_compile() const {
    return kind == toolchain_kind::COMPILED;
}

vector<string> toolchain_spec::compile_args(const fs::path &workdir) const {
    if (!compile_command)
        throw logic_error("Language " + id + " does not need compilation");
    return expand(*compile_command, workdir);
}

vector<string> toolchain_spec::run_args(const fs::path &workdir) const {
    return expand(run_command, workdir);
}

map<string, string> toolchain_spec::environment(const fs::path &workdir) const {
    map<string, string> result;
    for (auto &[key, value] : env) result[key] = expand(value, workdir);
    return result;
}

string toolchain_spec::expand(string arg, const fs::path &workdir) const {
    boost::replace_all(arg, "{workdir}", workdir.string());
    boost::replace_all(arg, "{source}", (workdir / source_name).string());
    boost::replace_all(arg, "{artifact}", (workdir / artifact_name).string());
    return arg;
}

vector<string> toolchain_spec::expand(const vector<string> &templ, const fs::path &workdir) const {
    vector<string> args;
    args.reserve(templ.size());
    for (auto &arg : templ) args.push_back(expand(arg, workdir));
    return args;
}

toolchain_registry::toolchain_registry(vector<toolchain_spec> list) {
    for (auto &spec : list) {
        string id = spec.id;
        if (!specs.emplace(id, move(spec)).second)
            throw config_error("Duplicate language " + id);
    }
}

toolchain_registry toolchain_registry::load(const fs::path &path) {
    try {
        return nlohmann::json::parse(read_file_content(path)).get<toolchain_registry>();
    } catch (config_error &) {
        throw;
    } catch (std::exception &e) {
        throw config_error("Toolchain table " + path.string() + " is malformed: " + e.what());
    }
}

const toolchain_spec *toolchain_registry::resolve(const string &language) const {
    auto it = specs.find(language);
    return it == specs.end() ? nullptr : &it->second;
}

vector<string> toolchain_registry::languages() const {
    vector<string> result;
    for (auto &[id, spec] : specs) result.push_back(id);
    return result;
}

void from_json(const nlohmann::json &j, toolchain_spec &spec) {
    spec.id = get_value<string>(j, "id");
    spec.display_name = get_value_def(j, spec.id, "name");

    string kind = get_value<string>(j, "kind");
    if (kind == "compiled")
        spec.kind = toolchain_kind::COMPILED;
    else if (kind == "interpreted")
        spec.kind = toolchain_kind::INTERPRETED;
    else
        throw config_error("Unrecognized toolchain kind " + kind + " of language " + spec.id);

    spec.source_name = assert_safe_path(get_value<string>(j, "source"));
    spec.artifact_name = assert_safe_path(get_value_def(j, spec.source_name, "artifact"));

    if (exists(j, "compile")) spec.compile_command = get_value<vector<string>>(j, "compile");
    spec.run_command = get_value<vector<string>>(j, "run");
    spec.env = get_value_def(j, map<string, string>(), "env");

    if (spec.needs_compile() != spec.compile_command.has_value())
        throw config_error("Language " + spec.id + " is " + kind + " but " +
                           (spec.compile_command ? "declares" : "does not declare") + " a compile command");
    if (spec.run_command.empty() || (spec.compile_command && spec.compile_command->empty()))
        throw config_error("Language " + spec.id + " has an empty command");

    if (exists(j, "compile_adjust")) spec.compile_adjust = j.at("compile_adjust").get<limit_adjustment>();
    if (exists(j, "run_adjust")) spec.run_adjust = j.at("run_adjust").get<limit_adjustment>();
}

void from_json(const nlohmann::json &j, toolchain_registry &registry) {
    vector<toolchain_spec> list;
    for (auto &item : get_value<nlohmann::json>(j, "languages"))
        list.push_back(item.get<toolchain_spec>());
    registry = toolchain_registry(move(list));
    LOG(INFO) << "Loaded " << registry.languages().size() << " toolchains";
}

}  // namespace grader
