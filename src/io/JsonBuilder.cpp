#include "io/JsonBuilder.hpp"
#include "core/Version.hpp"
#include "util/Crc32.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace io {

static std::string jsonEscape(const std::string& s) {
    std::ostringstream o;
    for (char c : s) {
        switch (c) {
            case '"':  o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\b': o << "\\b";  break;
            case '\f': o << "\\f";  break;
            case '\n': o << "\\n";  break;
            case '\r': o << "\\r";  break;
            case '\t': o << "\\t";  break;
            default:   o << c;      break;
        }
    }
    return "\"" + o.str() + "\"";
}

static std::string hex8(uint32_t v) {
    std::ostringstream hexss;
    hexss << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << v;
    return hexss.str();
}

std::string JsonBuilder::digest(const mpz_class& N) {
    return hex8(util::computeCRC32(N.get_str(10)));
}

std::string JsonBuilder::timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm timeinfo{};
    gmtime_r(&now, &timeinfo);
    char timestampBuf[32];
    std::strftime(timestampBuf, sizeof(timestampBuf), "%Y-%m-%d %H:%M:%S", &timeinfo);
    return timestampBuf;
}

std::string JsonBuilder::generate(const CliOptions& opts, const ResultRecord& r) {
    const bool found = (r.status == "F");
    const std::string n = r.N.get_str(10);
    const std::string factor = found ? r.factor.get_str(10) : std::string();
    const std::string cofactor = found ? r.cofactor.get_str(10) : std::string();
    const std::string ts = timestamp();

    std::ostringstream elapsed;
    elapsed << std::fixed << std::setprecision(3) << r.elapsed;

    std::ostringstream oss;
    oss << "{";
    oss <<  "\"status\":"     << jsonEscape(r.status);
    oss << ",\"N\":"          << jsonEscape(n);
    if (found) {
        oss << ",\"factor\":"   << jsonEscape(factor);
        oss << ",\"cofactor\":" << jsonEscape(cofactor);
    }
    oss << ",\"depth\":"      << opts.depth;
    oss << ",\"workers\":"    << r.workers;
    oss << ",\"iterations\":" << opts.iterations;
    oss << ",\"rounds\":"     << r.rounds;
    oss << ",\"blocks\":"     << r.blocks;
    oss << ",\"elapsed\":"    << elapsed.str();
    oss << ",\"program\":{"
        <<   "\"name\":"    << jsonEscape("tritfactor")
        <<   ",\"version\":" << jsonEscape(core::TRITFACTOR_VERSION)
        << "}";
    oss << ",\"timestamp\":"  << jsonEscape(ts);

    std::ostringstream canon;
    canon << r.status << ";" << n << ";" << factor << ";" << cofactor << ";"
          << opts.depth << ";" << opts.iterations << ";"
          << core::TRITFACTOR_VERSION << ";" << ts;
    oss << ",\"checksum\":{\"version\":1,\"checksum\":\""
        << hex8(util::computeCRC32(canon.str())) << "\"}";
    oss << "}";
    return oss.str();
}

void JsonBuilder::write(const std::string& json, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open " + path + " for writing JSON");
    }
    out << json;
}

} // namespace io
