#include "docflow/pdf_utils.hpp"
#include <zlib.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace docflow {

namespace {

constexpr size_t kMaxInflatedSize = 64 * 1024 * 1024;

bool is_delimiter(char c) {
    return std::isspace(static_cast<unsigned char>(c)) || std::strchr("()<>[]{}/%", c) != nullptr;
}

size_t skip_whitespace(const std::string& data, size_t pos) {
    while (pos < data.size() && std::isspace(static_cast<unsigned char>(data[pos]))) ++pos;
    return pos;
}

// Integer following a dictionary key such as /Count or /First, or -1
long integer_after(const std::string& body, const char* key) {
    size_t len = std::strlen(key);
    size_t pos = body.find(key);
    while (pos != std::string::npos) {
        size_t after = pos + len;
        if (after >= body.size() || is_delimiter(body[after])) {
            size_t digits = skip_whitespace(body, after);
            long value = 0;
            bool any = false;
            while (digits < body.size() && std::isdigit(static_cast<unsigned char>(body[digits]))) {
                value = value * 10 + (body[digits] - '0');
                any = true;
                ++digits;
                if (value > 10000000) return -1;
            }
            return any ? value : -1;
        }
        pos = body.find(key, after);
    }
    return -1;
}

enum class NodeKind { Other, Tree, Leaf };

NodeKind classify(const std::string& body) {
    NodeKind kind = NodeKind::Other;
    size_t pos = body.find("/Type");
    while (pos != std::string::npos) {
        size_t value = skip_whitespace(body, pos + 5);
        if (body.compare(value, 5, "/Page") == 0) {
            size_t after = value + 5;
            if (after < body.size() && body[after] == 's' &&
                (after + 1 >= body.size() || is_delimiter(body[after + 1]))) {
                return NodeKind::Tree;
            }
            if (after >= body.size() || is_delimiter(body[after])) {
                kind = NodeKind::Leaf;
            }
        }
        pos = body.find("/Type", pos + 5);
    }
    return kind;
}

std::string inflate_stream(const std::string& compressed) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (inflateInit(&zs) != Z_OK) {
        throw PdfPageCountError("zlib inflateInit failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
    zs.avail_in = static_cast<uInt>(compressed.size());

    std::string out;
    char buffer[16384];
    int status = Z_OK;
    while (status == Z_OK) {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);
        status = inflate(&zs, Z_NO_FLUSH);
        out.append(buffer, sizeof(buffer) - zs.avail_out);
        if (out.size() > kMaxInflatedSize) {
            status = Z_MEM_ERROR;
        }
    }
    std::string error = zs.msg ? zs.msg : "corrupt stream";
    inflateEnd(&zs);

    // Truncated streams still yield whatever was decoded
    if (status != Z_STREAM_END && status != Z_BUF_ERROR) {
        throw PdfPageCountError("zlib inflate failed: " + error);
    }
    return out;
}

// Member objects of an inflated /ObjStm: N pairs of "objnum offset", then bodies from /First
std::vector<std::string> split_object_stream(const std::string& dict, const std::string& content) {
    std::vector<std::string> objects;
    long count = integer_after(dict, "/N");
    long first = integer_after(dict, "/First");
    if (count <= 0 || first < 0 || static_cast<size_t>(first) > content.size()) return objects;

    std::vector<size_t> offsets;
    const char* cursor = content.c_str();
    const char* header_end = content.c_str() + first;
    for (long i = 0; i < count && cursor < header_end; ++i) {
        char* after_number = nullptr;
        std::strtol(cursor, &after_number, 10);
        char* after_offset = nullptr;
        long offset = std::strtol(after_number, &after_offset, 10);
        if (after_number == cursor || after_offset == after_number || offset < 0) break;
        cursor = after_offset;
        offsets.push_back(static_cast<size_t>(first) + static_cast<size_t>(offset));
    }

    for (size_t i = 0; i < offsets.size(); ++i) {
        size_t begin = std::min(offsets[i], content.size());
        size_t end = i + 1 < offsets.size() ? std::min(offsets[i + 1], content.size()) : content.size();
        if (end > begin) objects.push_back(content.substr(begin, end - begin));
    }
    return objects;
}

struct PageTally {
    long tree_count = 0;
    long leaf_count = 0;

    void add(const std::string& body) {
        switch (classify(body)) {
            case NodeKind::Tree:
                tree_count = std::max(tree_count, integer_after(body, "/Count"));
                break;
            case NodeKind::Leaf:
                ++leaf_count;
                break;
            case NodeKind::Other:
                break;
        }
    }
};

// Dictionary part of an indirect object and, when present, its raw stream bytes
void split_stream(const std::string& body, std::string& dict, std::string& stream) {
    size_t keyword = body.find("stream");
    while (keyword != std::string::npos && keyword >= 3 && body.compare(keyword - 3, 3, "end") == 0) {
        keyword = body.find("stream", keyword + 6);
    }
    if (keyword == std::string::npos) {
        dict = body;
        stream.clear();
        return;
    }
    dict = body.substr(0, keyword);
    size_t data = keyword + 6;
    if (data < body.size() && body[data] == '\r') ++data;
    if (data < body.size() && body[data] == '\n') ++data;
    size_t end = body.find("endstream", data);
    stream = body.substr(data, (end == std::string::npos ? body.size() : end) - data);
}

} // anonymous namespace

int count_pdf_pages(const std::string& data) {
    // The header may follow a few bytes of garbage
    size_t header = data.find("%PDF-");
    if (header == std::string::npos || header > 1024) {
        throw std::invalid_argument("Not a PDF document");
    }

    PageTally tally;
    std::string dict;
    std::string stream;

    size_t pos = data.find(" obj", header);
    while (pos != std::string::npos) {
        size_t body_start = pos + 4;
        size_t body_end = data.find("endobj", body_start);
        if (body_end == std::string::npos) body_end = data.size();

        split_stream(data.substr(body_start, body_end - body_start), dict, stream);
        tally.add(dict);

        // PDF 1.5+ writers keep the page tree inside compressed object streams
        if (!stream.empty() && dict.find("/ObjStm") != std::string::npos &&
            dict.find("/FlateDecode") != std::string::npos) {
            for (const auto& member : split_object_stream(dict, inflate_stream(stream))) {
                tally.add(member);
            }
        }

        pos = data.find(" obj", body_end);
    }

    long pages = tally.tree_count > 0 ? tally.tree_count : tally.leaf_count;
    if (pages <= 0) {
        throw PdfPageCountError("Could not determine PDF page count");
    }
    return static_cast<int>(pages);
}

} // namespace docflow
