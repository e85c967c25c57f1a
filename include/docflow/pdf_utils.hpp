#pragma once

#include <stdexcept>
#include <string>

namespace docflow {

// The data is a PDF but its page tree could not be read
class PdfPageCountError : public std::runtime_error {
public:
    explicit PdfPageCountError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Page count of a PDF held in memory.
 *
 * Reads the /Count of the page tree root, falling back to counting page
 * objects. Flate-compressed object streams (PDF 1.5+) are inflated and
 * searched as well. Throws std::invalid_argument if the data is not a PDF
 * and PdfPageCountError if no page tree can be found.
 */
int count_pdf_pages(const std::string& data);

} // namespace docflow
