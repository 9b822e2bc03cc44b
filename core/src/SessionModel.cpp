#include "romfetch/SessionModel.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace romfetch {

ResultSet ResultSet::fromPaths(const std::string &platform,
                               const std::string &query,
                               const std::string &baseDir, std::size_t limit,
                               const std::vector<std::string> &paths) {
    ResultSet rs;
    rs.platform = platform;
    rs.query = query;
    rs.baseDir = baseDir;
    rs.limit = limit;
    rs.items.reserve(paths.size());

    std::string prefix = baseDir;
    if (prefix.empty() || prefix.back() != '/')
        prefix += '/';
    for (const auto &p : paths) {
        std::string label = p;
        if (label.compare(0, prefix.size(), prefix) == 0)
            label.erase(0, prefix.size());
        rs.items.push_back(ResultItem{label, p});
    }
    return rs;
}

const ResultItem *ResultSet::find(const std::string &label) const {
    for (const auto &item : items) {
        if (item.label == label)
            return &item;
    }
    return nullptr;
}

bool SelectionState::toggle(const std::string &label) {
    auto it = labels.find(label);
    if (it != labels.end()) {
        labels.erase(it);
        return false;
    }
    labels.insert(label);
    return true;
}

std::string localPathFor(const std::string &destRoot,
                         const std::string &platform,
                         const std::string &label) {
    fs::path p(destRoot);
    p /= platform;
    // Labels use '/' regardless of the local separator. Dot segments are
    // dropped so a label never leaves the platform directory.
    std::size_t start = 0;
    while (start <= label.size()) {
        const auto slash = label.find('/', start);
        const std::string part = label.substr(
            start, slash == std::string::npos ? std::string::npos
                                              : slash - start);
        if (!part.empty() && part != "." && part != "..")
            p /= part;
        if (slash == std::string::npos)
            break;
        start = slash + 1;
    }
    return p.string();
}

std::vector<BatchTask> buildBatch(const ResultSet &results,
                                  const SelectionState &selection,
                                  const std::string &destRoot) {
    std::vector<BatchTask> tasks;
    for (const auto &item : results.items) {
        if (!selection.contains(item.label))
            continue;
        tasks.push_back(BatchTask{
            item.label, item.remotePath,
            localPathFor(destRoot, results.platform, item.label)});
    }
    return tasks;
}

} // namespace romfetch
