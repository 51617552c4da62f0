#include "wellscan/persist/JsonFile.hpp"

#include "wellscan/core/Error.hpp"
#include "wellscan/log/Log.hpp"

#include <cerrno>
#include <fstream>

namespace wellscan::persist {

namespace {

std::error_code lastOsError() {
    const int code = errno != 0 ? errno : EIO;
    return std::error_code(code, std::generic_category());
}

} // namespace

expected<nlohmann::json> readJsonFile(const std::string& path) {
    errno = 0;
    std::ifstream file(path);
    if (!file) {
        auto ec = lastOsError();
        logError("[JsonFile] cannot open ", path, ": ", ec.message(), "\n");
        return unexpected(ec);
    }

    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        logError("[JsonFile] ", path, " is not valid JSON: ", e.what(), "\n");
        return unexpected(make_error_code(Errc::InvalidPayload));
    }
}

expected<void> writeJsonFile(const std::string& path, const nlohmann::ordered_json& document) {
    errno = 0;
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        auto ec = lastOsError();
        logError("[JsonFile] cannot write ", path, ": ", ec.message(), "\n");
        return unexpected(ec);
    }

    try {
        file << document.dump(2) << '\n';
    } catch (const nlohmann::json::exception& e) {
        // dump() throws on invalid UTF-8 in string values (notes, timestamps).
        logError("[JsonFile] cannot serialise ", path, ": ", e.what(), "\n");
        return unexpected(make_error_code(Errc::InvalidPayload));
    }

    file.flush();
    if (!file) {
        auto ec = lastOsError();
        logError("[JsonFile] write to ", path, " failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    return {};
}

nlohmann::ordered_json pointToJson(const geometry::Point3& point) {
    return nlohmann::ordered_json{{"X", point.x}, {"Y", point.y}, {"Z", point.z}};
}

geometry::Point3 pointFromJson(const nlohmann::json& node) {
    return geometry::Point3{node.at("X").get<double>(),
                            node.at("Y").get<double>(),
                            node.at("Z").get<double>()};
}

} // namespace wellscan::persist
