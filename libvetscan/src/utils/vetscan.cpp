/**
 * @file vetscan.cpp
 * @brief Implementation of the public Vetscan API.
 */

#include "../../include/vetscan.hpp"

#include "../../include/command_ocr_adapter.hpp"
#include "../../include/clock.hpp"
#include "../../include/document_pipeline.hpp"
#include "../../include/errors.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/log_sink.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include "../../include/thread_pool.hpp"

#include <mutex>
#include <thread>

namespace vetscan {

namespace {

// observer pointer shared with the log sink, which outlives the facade
struct ObserverSlot {
    std::mutex mtx;
    VetscanObserver* observer = nullptr;
};

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    std::shared_ptr<ObserverSlot> slot_;
public:
    explicit BridgeLogSink(std::shared_ptr<ObserverSlot> slot) : slot_(std::move(slot)) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        std::lock_guard lock(slot_->mtx);
        if (slot_->observer) {
            slot_->observer->onLog(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

} // namespace

struct Vetscan::Impl {
    EventBus eventBus;
    SteadyClock clock;

    PipelineConfig pipelineConfig;
    unsigned numThreads = std::thread::hardware_concurrency() / 2;
    std::unique_ptr<IOcrAdapter> ocr = std::make_unique<CommandOcrAdapter>();
    std::unique_ptr<IImageStore> store = std::make_unique<FilesystemImageStore>("extracted_images");

    std::shared_ptr<ObserverSlot> slot = std::make_shared<ObserverSlot>();
    bool bridged = false;

    std::mutex pipelineMtx;
    DocumentPipeline* currentPipeline = nullptr;
    bool inProcess = false;
    bool pendingStop = false; // stop() seen before the pipeline was registered

    Impl() {
        if (numThreads == 0) numThreads = 1;
    }

    ~Impl() {
        std::lock_guard lock(slot->mtx);
        slot->observer = nullptr;
    }

    VetscanObserver* observer() {
        std::lock_guard lock(slot->mtx);
        return slot->observer;
    }

    // subscriptions read the observer at delivery time, so they are set up once
    void setupEventBridging() {
        if (bridged) return;
        bridged = true;

        Logger::add_sink(std::make_unique<BridgeLogSink>(slot));

        eventBus.subscribe<PipelineStateEvent>([this](const PipelineStateEvent& e) {
            if (auto* obs = observer()) obs->onStateChange(e.document_id, std::string(to_string(e.state)));
        });

        eventBus.subscribe<ChunkOcrRetryEvent>([this](const ChunkOcrRetryEvent& e) {
            if (auto* obs = observer()) {
                obs->onChunkRetry(e.document_id, e.chunk.start_page, e.chunk.end_page, e.attempt, e.error_message);
            }
        });

        eventBus.subscribe<ImageSkippedEvent>([this](const ImageSkippedEvent& e) {
            if (auto* obs = observer()) obs->onImageSkipped(e.document_id, e.page_number, e.index_on_page, e.reason);
        });

        eventBus.subscribe<ImageStoreErrorEvent>([this](const ImageStoreErrorEvent& e) {
            if (auto* obs = observer()) {
                obs->onImageSkipped(e.document_id, e.page_number, e.image_index, "not stored: " + e.error_message);
            }
        });

        eventBus.subscribe<DocumentCompleteEvent>([this](const DocumentCompleteEvent& e) {
            if (auto* obs = observer()) obs->onDocumentFinish(e.document_id, e.total_pages, e.images, e.seconds);
        });

        eventBus.subscribe<DocumentErrorEvent>([this](const DocumentErrorEvent& e) {
            if (auto* obs = observer()) {
                obs->onDocumentError(e.document_id, std::string(to_string(e.kind)), e.error_message);
            }
        });
    }
};

Vetscan::Vetscan() : impl_(std::make_unique<Impl>()) {}

Vetscan::~Vetscan() {
    if (impl_) stop();
}

Vetscan::Vetscan(Vetscan&&) noexcept = default;
Vetscan& Vetscan::operator=(Vetscan&&) noexcept = default;

Vetscan& Vetscan::config(const PipelineConfig& cfg) {
    cfg.validate();
    impl_->pipelineConfig = cfg;
    return *this;
}

Vetscan& Vetscan::threads(const unsigned val) {
    impl_->numThreads = val > 0 ? val : std::thread::hardware_concurrency() / 2;
    if (impl_->numThreads == 0) impl_->numThreads = 1;
    return *this;
}

Vetscan& Vetscan::ocrAdapter(std::unique_ptr<IOcrAdapter> adapter) {
    if (adapter) impl_->ocr = std::move(adapter);
    return *this;
}

Vetscan& Vetscan::imageStore(std::unique_ptr<IImageStore> store) {
    if (store) impl_->store = std::move(store);
    return *this;
}

void Vetscan::setObserver(VetscanObserver* observer) {
    {
        std::lock_guard lock(impl_->slot->mtx);
        impl_->slot->observer = observer;
    }
    if (observer) impl_->setupEventBridging();
}

ProcessingResult Vetscan::process(const std::filesystem::path& path) {
    std::vector<std::uint8_t> bytes;
    try {
        bytes = read_file_bytes(path);
    } catch (const std::exception& e) {
        throw InvalidDocumentError(e.what());
    }
    return process(std::string(), path.filename().string(), std::move(bytes));
}

ProcessingResult Vetscan::process(const std::string& document_id,
                                  const std::string& filename,
                                  std::vector<std::uint8_t> bytes) {
    const std::string id = document_id.empty() ? RandomUtils::random_hex_id(12) : document_id;
    const std::string name = sanitize_filename(filename);

    // Marks the facade busy for the whole call and unregisters the pipeline
    // before it is destroyed, so stop() never reaches a dead pipeline.
    struct ActiveDocument {
        Impl& impl;
        explicit ActiveDocument(Impl& i) : impl(i) {
            std::lock_guard lock(impl.pipelineMtx);
            impl.inProcess = true;
            impl.pendingStop = false;
        }
        void attach(DocumentPipeline& pipeline) {
            std::lock_guard lock(impl.pipelineMtx);
            impl.currentPipeline = &pipeline;
            if (impl.pendingStop) pipeline.request_stop();
        }
        void detach() {
            std::lock_guard lock(impl.pipelineMtx);
            impl.currentPipeline = nullptr;
        }
        ~ActiveDocument() {
            std::lock_guard lock(impl.pipelineMtx);
            impl.currentPipeline = nullptr;
            impl.inProcess = false;
            impl.pendingStop = false;
        }
    };
    ActiveDocument active(*impl_);

    if (auto* obs = impl_->observer()) obs->onDocumentStart(id, name);

    ThreadPool pool(impl_->numThreads);
    DocumentPipeline pipeline(*impl_->ocr, *impl_->store, impl_->clock, impl_->eventBus, pool);
    active.attach(pipeline);

    try {
        auto result = pipeline.process(id, name, std::move(bytes), impl_->pipelineConfig);
        active.detach();
        return result;
    } catch (...) {
        active.detach();
        throw;
    }
}

void Vetscan::stop() {
    std::lock_guard lock(impl_->pipelineMtx);
    if (impl_->currentPipeline) {
        impl_->currentPipeline->request_stop();
    } else if (impl_->inProcess) {
        impl_->pendingStop = true;
    }
}

} // namespace vetscan
