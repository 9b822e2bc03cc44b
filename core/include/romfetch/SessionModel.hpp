// Search results and selection state kept by the session between screens.
#pragma once
#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace romfetch {

struct ResultItem {
    std::string label;      // path relative to the search base
    std::string remotePath; // absolute remote path
};

struct ResultSet {
    std::string platform;
    std::string query;
    std::string baseDir;
    std::size_t limit = 0;
    std::vector<ResultItem> items; // discovery order

    // Builds items from absolute paths under `baseDir`.
    static ResultSet fromPaths(const std::string &platform,
                               const std::string &query,
                               const std::string &baseDir, std::size_t limit,
                               const std::vector<std::string> &paths);

    const ResultItem *find(const std::string &label) const;
};

// Multi-select mode and the labels picked in it.
struct SelectionState {
    bool multiSelect = false;
    std::unordered_set<std::string> labels;

    bool contains(const std::string &label) const {
        return labels.count(label) > 0;
    }
    // Returns true when the label is now selected.
    bool toggle(const std::string &label);
    void reset() {
        labels.clear();
        multiSelect = false;
    }
};

struct BatchTask {
    std::string label;
    std::string remotePath;
    std::string localPath;
};

// Local destination of a result: <destRoot>/<platform>/<label>.
std::string localPathFor(const std::string &destRoot,
                         const std::string &platform, const std::string &label);

// Selected items in ResultSet order, independent of the order they were
// picked in.
std::vector<BatchTask> buildBatch(const ResultSet &results,
                                  const SelectionState &selection,
                                  const std::string &destRoot);

} // namespace romfetch
