#include "salesforce_path_interpreter.hpp"
#include "sfrest_tracing.hpp"

namespace sfrest {

static constexpr const char *DESCRIBE_SEGMENT = "describe";
static constexpr const char *SOQL_TOKEN = "query?q=SELECT";
static constexpr const char *FROM_TOKEN = "FROM+";
static constexpr const char *WHERE_TOKEN = "+WHERE";
static constexpr const char *SOBJECTS_SEGMENT = "sobjects";

std::string SalesforcePathInterpreter::ObjectNameFromPath(const std::string &path) {
    std::string object_name;

    if (HasDescribeSegment(path)) {
        object_name = ObjectNameAfterSObjects(path);
    } else if (path.find(SOQL_TOKEN) != std::string::npos) {
        object_name = ObjectNameFromSoqlPath(path);
    } else if (path == SOBJECTS_SEGMENT) {
        object_name = "";
    } else {
        object_name = ObjectNameAfterSObjects(path);
    }

    SFREST_TRACE_TRACE("SF_PATH", "Path '" + path + "' resolves to object '" + object_name + "'");
    return object_name;
}

bool SalesforcePathInterpreter::HasDescribeSegment(const std::string &path) {
    for (const auto &segment : SplitSegments(path)) {
        if (segment == DESCRIBE_SEGMENT) {
            return true;
        }
    }
    return false;
}

std::string SalesforcePathInterpreter::ObjectNameFromSoqlPath(const std::string &path) {
    auto from_pos = path.find(FROM_TOKEN);
    if (from_pos == std::string::npos) {
        // Not the shape we understand (e.g. a lower case "from"), validation is skipped
        SFREST_TRACE_DEBUG("SF_PATH", "No FROM+ token in SOQL path: " + path);
        return "";
    }

    auto name_start = from_pos + std::string(FROM_TOKEN).length();
    auto where_pos = path.find(WHERE_TOKEN, name_start);
    if (where_pos == std::string::npos) {
        return path.substr(name_start);
    }
    return path.substr(name_start, where_pos - name_start);
}

std::string SalesforcePathInterpreter::ObjectNameAfterSObjects(const std::string &path) {
    auto segments = SplitSegments(path);
    for (size_t i = 0; i < segments.size(); i++) {
        if (segments[i] == SOBJECTS_SEGMENT) {
            return i + 1 < segments.size() ? segments[i + 1] : "";
        }
    }
    return "";
}

std::vector<std::string> SalesforcePathInterpreter::SplitSegments(const std::string &path) {
    std::vector<std::string> segments;
    // Query strings never carry a path segment we care about
    auto path_only = path.substr(0, path.find('?'));

    size_t start = 0;
    while (start <= path_only.length()) {
        auto end = path_only.find('/', start);
        if (end == std::string::npos) {
            end = path_only.length();
        }
        if (end > start) {
            segments.push_back(path_only.substr(start, end - start));
        }
        start = end + 1;
    }
    return segments;
}

} // namespace sfrest
