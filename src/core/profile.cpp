/**
 * @file profile.cpp
 * @brief Implementation of the scope timer described in profile.hpp
 */

#include "quadsim/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    auto& data = instance.sections[name];

    if (!instance.open_scopes.empty()) {
        const std::string& parentName = instance.open_scopes.back().name;
        if (data.parent_name != parentName) {
            if (!data.parent_name.empty()) {
                auto& oldSiblings = instance.sections[data.parent_name].children;
                oldSiblings.erase(std::remove(oldSiblings.begin(), oldSiblings.end(), name),
                                  oldSiblings.end());
            }
            data.parent_name = parentName;
            auto& siblings = instance.sections[parentName].children;
            if (std::find(siblings.begin(), siblings.end(), name) == siblings.end()) {
                siblings.push_back(name);
            }
        }
    }

    instance.open_scopes.push_back({name, Clock::now()});
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();

    if (instance.open_scopes.empty() || instance.open_scopes.back().name != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") does not match the innermost open scope.\n";
        return;
    }

    Duration const elapsed = Clock::now() - instance.open_scopes.back().start_time;
    instance.open_scopes.pop_back();

    auto& data = instance.sections[name];
    data.total_time += elapsed;
    data.max_time = std::max(data.max_time, elapsed);
    data.call_count += 1;
}

const Profiler::ProfileData* Profiler::getData(const std::string& name) {
    auto& instance = getInstance();
    auto it = instance.sections.find(name);
    return it == instance.sections.end() ? nullptr : &it->second;
}

void Profiler::printStats() {
    auto& instance = getInstance();
    std::cout << "\nProfiling Statistics:\n";

    std::vector<std::string> roots;
    for (const auto& [name, data] : instance.sections) {
        if (data.parent_name.empty()) {
            roots.push_back(name);
        }
    }
    std::sort(roots.begin(), roots.end());

    for (size_t i = 0; i < roots.size(); ++i) {
        printNode(roots[i], "", i == roots.size() - 1);
    }
}

void Profiler::printNode(const std::string& name, const std::string& prefix, bool isLast) {
    const auto& data = getInstance().sections.at(name);

    double const totalMs = std::chrono::duration<double, std::milli>(data.total_time).count();
    double const maxMs = std::chrono::duration<double, std::milli>(data.max_time).count();
    double const avgMs = data.call_count > 0 ? totalMs / data.call_count : 0.0;

    std::cout << prefix << (isLast ? "`-- " : "|-- ")
              << name << " [" << data.call_count << " calls] "
              << std::fixed << std::setprecision(3)
              << totalMs << "ms total, " << avgMs << "ms avg, " << maxMs << "ms max\n";

    for (size_t i = 0; i < data.children.size(); ++i) {
        std::string const childPrefix = prefix + (isLast ? "    " : "|   ");
        printNode(data.children[i], childPrefix, i == data.children.size() - 1);
    }
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.open_scopes.clear();
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
