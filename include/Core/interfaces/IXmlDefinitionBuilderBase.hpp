#pragma once

#include <pugixml.hpp>
#include <string>

/**
 * @brief Abstract base class for building libvirt XML documents
 *
 * Derived classes describe the document structure in buildDocument();
 * build() serializes it with two-space indentation.
 */
class IXmlBuilderBase {
protected:
    pugi::xml_document doc;     ///< Underlying XML document

    virtual void buildDocument() = 0;

public:
    IXmlBuilderBase() = default;

    // Non-copyable
    IXmlBuilderBase(const IXmlBuilderBase&) = delete;
    IXmlBuilderBase& operator=(const IXmlBuilderBase&) = delete;

    /**
     * @brief Builds and returns the formatted XML document
     *
     * The document is rebuilt from scratch on every call.
     */
    [[nodiscard]] std::string build() {
        doc.reset();
        buildDocument();

        struct xml_string_writer : pugi::xml_writer {
            std::string result;
            void write(const void* data, size_t size) override {
                result.append(static_cast<const char*>(data), size);
            }
        };

        xml_string_writer writer;
        doc.save(writer, "  ", pugi::format_default | pugi::format_no_declaration);
        return writer.result;
    }

    void reset() noexcept {
        doc.reset();
    }

    [[nodiscard]] const pugi::xml_document& getDocument() const noexcept {
        return doc;
    }

    virtual ~IXmlBuilderBase() = default;
};
