#include "../../include/image_extractor.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/qpdf_session.hpp"
#include <qpdf/QPDFObjGen.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <optional>
#include <set>
#include <stdexcept>

namespace {

/**
 * @brief Content stream callback collecting the operands of `Do`, in order.
 */
class DoCollector final : public QPDFObjectHandle::ParserCallbacks {
public:
    using QPDFObjectHandle::ParserCallbacks::handleObject;

    void handleObject(QPDFObjectHandle obj) override {
        if (obj.isOperator()) {
            if (obj.getOperatorValue() == "Do" && pending_name_) {
                names_.push_back(*pending_name_);
            }
            pending_name_.reset();
        } else if (obj.isName()) {
            pending_name_ = obj.getName();
        } else {
            pending_name_.reset();
        }
    }

    void handleEOF() override {}

    std::vector<std::string> take() { return std::move(names_); }

private:
    std::optional<std::string> pending_name_;
    std::vector<std::string> names_;
};

bool has_subtype(QPDFObjectHandle xobj, const std::string& subtype) {
    auto value = xobj.getDict().getKey("/Subtype");
    return value.isName() && value.getName() == subtype;
}

} // namespace

namespace vetscan {

struct ImageExtractor::Walk {
    PageImages result;
    std::size_t next_index = 0;
    std::set<QPDFObjGen> open_forms; // cycle guard
    const std::stop_token& stop;
};

PageImages ImageExtractor::extract_page(const PdfDocument& document, const std::size_t page_number,
                                        const std::stop_token& stop) const {
    if (page_number >= document.page_count()) {
        throw std::out_of_range("page " + std::to_string(page_number) + " outside document of " +
                                std::to_string(document.page_count()) + " pages");
    }

    QpdfSession session(document.bytes(), "image extraction", "image_extractor");
    auto pages = QPDFPageDocumentHelper(session.pdf()).getAllPages();
    auto& page = pages[page_number];

    Walk state{{}, 0, {}, stop};
    state.result.page_number = page_number;

    DoCollector collector;
    try {
        page.parseContents(&collector);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning,
                    "Page " + std::to_string(page_number) + " content stream unreadable: " + e.what(),
                    "image_extractor");
        state.result.skipped.push_back({0, std::string("content stream unreadable: ") + e.what()});
        return std::move(state.result);
    }

    walk(state, page.getAttribute("/Resources", false), collector.take());

    Logger::log(LogLevel::Debug,
                "Page " + std::to_string(page_number) + ": " + std::to_string(state.result.candidates.size()) +
                " images kept, " + std::to_string(state.result.skipped.size()) + " skipped",
                "image_extractor");
    return std::move(state.result);
}

void ImageExtractor::walk(Walk& state, QPDFObjectHandle resources, const std::vector<std::string>& names) const {
    auto xobjects = resources.isDictionary() ? resources.getKey("/XObject") : QPDFObjectHandle::newNull();

    for (const auto& name : names) {
        if (state.stop.stop_requested()) {
            throw CancelledError();
        }
        if (!xobjects.isDictionary() || !xobjects.hasKey(name)) {
            Logger::log(LogLevel::Debug, "Unresolved XObject " + name, "image_extractor");
            continue;
        }
        auto xobj = xobjects.getKey(name);
        if (!xobj.isStream()) continue;

        if (has_subtype(xobj, "/Image")) {
            take_image(state, xobj);
        } else if (has_subtype(xobj, "/Form")) {
            const auto og = xobj.getObjGen();
            if (state.open_forms.contains(og)) {
                Logger::log(LogLevel::Warning, "Form XObject " + std::to_string(og.getObj()) + " draws itself; not followed",
                            "image_extractor");
                continue;
            }

            DoCollector collector;
            try {
                xobj.parseAsContents(&collector);
            } catch (const std::exception& e) {
                Logger::log(LogLevel::Warning, "Form XObject " + name + " unreadable: " + e.what(),
                            "image_extractor");
                continue;
            }

            // a form without its own resources uses the resources it is drawn with
            auto form_resources = xobj.getDict().getKey("/Resources");
            state.open_forms.insert(og);
            walk(state, form_resources.isDictionary() ? form_resources : resources, collector.take());
            state.open_forms.erase(og);
        }
    }
}

void ImageExtractor::take_image(Walk& state, QPDFObjectHandle image) const {
    const std::size_t index = state.next_index++;
    const std::size_t page = state.result.page_number;
    try {
        const auto& decoder = registry_.select(image);
        auto decoded = decoder.decode(image);

        RawImageCandidate candidate;
        candidate.page_number = page;
        candidate.index_on_page = index;
        candidate.width = decoded.width;
        candidate.height = decoded.height;
        candidate.format = decoded.format;

        if (candidate.area() < min_image_area_px_) {
            Logger::log(LogLevel::Debug,
                        "Page " + std::to_string(page) + " image " + std::to_string(index) + " below minimum area (" +
                        std::to_string(decoded.width) + "x" + std::to_string(decoded.height) + ")",
                        "image_extractor");
            return;
        }

        candidate.bytes = std::move(decoded.bytes);
        state.result.candidates.push_back(std::move(candidate));
    } catch (const std::exception& e) {
        // ImageDecodeError and anything qpdf throws on a damaged object
        Logger::log(LogLevel::Warning,
                    "Page " + std::to_string(page) + " image " + std::to_string(index) + " skipped: " + e.what(),
                    "image_extractor");
        state.result.skipped.push_back({index, e.what()});
    }
}

} // namespace vetscan
