#include "infrastructure/plugin/PluginScriptRunner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#ifdef _WIN32
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace portprobe::infra {

namespace {

constexpr const char* CreateSymbol = "portprobe_create_script";
constexpr const char* DestroySymbol = "portprobe_destroy_script";

#if defined(_WIN32)
constexpr const char* LibraryExtension = ".dll";
#elif defined(__APPLE__)
constexpr const char* LibraryExtension = ".dylib";
#else
constexpr const char* LibraryExtension = ".so";
#endif

} // namespace

PluginScriptRunner::~PluginScriptRunner() {
    unloadAll();
}

core::ScriptResult PluginScriptRunner::runScript(const std::string& scriptId,
                                                 const std::string& host,
                                                 std::optional<uint16_t> port) {
    auto script = instanceFor(scriptId);

    core::ScriptResult result;
    try {
        result = script->run(host, port);
    } catch (const std::exception& e) {
        spdlog::warn("Script {} failed on {}: {}", script->metadata().id, host, e.what());
        result.success = false;
        result.error = e.what();
    }

    if (result.scriptName.empty()) {
        result.scriptName = script->metadata().name;
    }
    if (result.host.empty()) {
        result.host = host;
    }
    if (!result.port) {
        result.port = port;
    }
    return result;
}

std::shared_ptr<core::IScanScript> PluginScriptRunner::instanceFor(const std::string& scriptId) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = loadedScripts_.find(scriptId);
        if (it != loadedScripts_.end()) {
            return it->second.instance;
        }
    }

    load(scriptId);

    std::lock_guard<std::mutex> lock(mutex_);
    return loadedScripts_.at(scriptId).instance;
}

const core::ScriptMetadata& PluginScriptRunner::load(const std::filesystem::path& path) {
    const auto scriptId = path.string();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = loadedScripts_.find(scriptId);
        if (it != loadedScripts_.end()) {
            return it->second.instance->metadata();
        }
    }

    if (!std::filesystem::exists(path)) {
        throw ScriptError("Script file not found: " + scriptId);
    }

    void* handle = openLibrary(path);
    if (!handle) {
        throw ScriptError("Failed to open script library " + scriptId + ": " + lastLibraryError());
    }

    auto createFunc = reinterpret_cast<core::CreateScriptFunc>(getSymbol(handle, CreateSymbol));
    auto destroyFunc = reinterpret_cast<core::DestroyScriptFunc>(getSymbol(handle, DestroySymbol));
    if (!createFunc || !destroyFunc) {
        closeLibrary(handle);
        throw ScriptError("Script library " + scriptId + " does not export " + CreateSymbol +
                          " and " + DestroySymbol);
    }

    core::IScanScript* rawScript = nullptr;
    try {
        rawScript = createFunc();
    } catch (const std::exception& e) {
        closeLibrary(handle);
        throw ScriptError("Script creation failed: " + scriptId + " - " + e.what());
    }

    if (!rawScript) {
        closeLibrary(handle);
        throw ScriptError("Script creation returned null: " + scriptId);
    }

    LoadedScript loaded;
    loaded.instance = std::shared_ptr<core::IScanScript>(
        rawScript, [destroyFunc](core::IScanScript* script) { destroyFunc(script); });
    loaded.handle = handle;
    loaded.path = path;

    {
        const auto& metadata = loaded.instance->metadata();
        spdlog::info("Script loaded: {} v{} ({})", metadata.name, metadata.version, metadata.id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = loadedScripts_.try_emplace(scriptId, std::move(loaded));
    if (!inserted) {
        // Loaded concurrently by another caller; keep the first instance
        spdlog::debug("Script {} was loaded twice, dropping the duplicate", scriptId);
        loaded.instance.reset();
        closeLibrary(loaded.handle);
    }
    return it->second.instance->metadata();
}

std::vector<ScriptListing> PluginScriptRunner::listScripts(const std::filesystem::path& directory) {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        throw ScriptError("Script directory not found: " + directory.string());
    }

    std::vector<std::filesystem::path> candidates;
    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == LibraryExtension) {
            candidates.push_back(entry.path());
        }
    }
    if (ec) {
        throw ScriptError("Cannot read script directory " + directory.string() + ": " +
                          ec.message());
    }
    std::sort(candidates.begin(), candidates.end());

    std::vector<ScriptListing> listings;
    for (const auto& path : candidates) {
        try {
            listings.push_back({path, load(path)});
        } catch (const ScriptError& e) {
            spdlog::warn("Skipping {}: {}", path.string(), e.what());
        }
    }

    spdlog::debug("Found {} scripts in {}", listings.size(), directory.string());
    return listings;
}

void PluginScriptRunner::unloadAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, loaded] : loadedScripts_) {
        // The instance must be gone before its code is unmapped
        loaded.instance.reset();
        closeLibrary(loaded.handle);
        spdlog::debug("Script unloaded: {}", id);
    }
    loadedScripts_.clear();
}

void* PluginScriptRunner::openLibrary(const std::filesystem::path& path) {
#ifdef _WIN32
    return LoadLibraryA(path.string().c_str());
#else
    return dlopen(path.string().c_str(), RTLD_NOW | RTLD_LOCAL);
#endif
}

void PluginScriptRunner::closeLibrary(void* handle) {
    if (!handle) return;
#ifdef _WIN32
    FreeLibrary(static_cast<HMODULE>(handle));
#else
    dlclose(handle);
#endif
}

void* PluginScriptRunner::getSymbol(void* handle, const std::string& name) {
    if (!handle) return nullptr;
#ifdef _WIN32
    return reinterpret_cast<void*>(GetProcAddress(static_cast<HMODULE>(handle), name.c_str()));
#else
    return dlsym(handle, name.c_str());
#endif
}

std::string PluginScriptRunner::lastLibraryError() {
#ifdef _WIN32
    return "error " + std::to_string(GetLastError());
#else
    const char* error = dlerror();
    return error ? error : "unknown error";
#endif
}

} // namespace portprobe::infra
