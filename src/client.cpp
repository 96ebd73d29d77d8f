#include "batchdl/client.hpp"

#include "batchdl/curl_transport.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace batchdl {

namespace {

constexpr long kRangeNotSatisfiable = 416;

std::uint64_t existingSize(const std::string& filename) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(filename, ec)) {
        return 0;
    }
    const auto size = std::filesystem::file_size(filename, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

detail::FilePtr openDestination(const std::string& filename, const char* mode) {
    detail::FilePtr file{std::fopen(filename.c_str(), mode)};
    if (!file) {
        throw Error(ErrorKind::Filesystem,
                    fmt::format("Cannot create destination file {}: {}", filename,
                                std::strerror(errno)));
    }
    return file;
}

bool isSuccessStatus(long code) {
    // 0 is reported for schemes without status codes
    return code == 0 || (code >= 200 && code < 300);
}

} // namespace

Client::Client(ClientOptions options)
    : options_(std::move(options)), transport_(std::make_shared<CurlTransport>(options_)) {}

Client::Client(ClientOptions options, std::shared_ptr<Transport> transport)
    : options_(std::move(options)), transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("Client requires a transport");
    }
}

Client::~Client() {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    for (auto& worker : threads_) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

ResponsePtr Client::execute(const RequestPtr& request, const Context& context) {
    auto response = prepare(request, nullptr);
    perform(*response, context);
    return response;
}

ResponsePtr Client::start(const RequestPtr& request, const Context& context) {
    auto response = prepare(request, nullptr);
    spawn([this, response, context] { perform(*response, context); });
    return response;
}

ResponsePtr Client::get(const std::string& destination_dir, const std::string& url,
                        const Context& context) {
    auto request = std::make_shared<const Request>(makeRequest(destination_dir, url));
    return execute(request, context);
}

std::shared_ptr<ResponseChannel> Client::batch(const Context& context, std::size_t workers,
                                               const std::string& destination_dir,
                                               const std::vector<std::string>& urls) {
    std::error_code ec;
    if (!std::filesystem::is_directory(destination_dir, ec)) {
        throw Error(ErrorKind::InvalidRequest,
                    fmt::format("Destination is not a directory: {}", destination_dir));
    }

    std::vector<RequestPtr> requests;
    requests.reserve(urls.size());
    std::set<std::string> filenames;
    for (const auto& url : urls) {
        auto request = std::make_shared<const Request>(makeRequest(destination_dir, url));
        if (!filenames.insert(request->filename).second) {
            throw Error(ErrorKind::InvalidRequest,
                        fmt::format("More than one URL downloads to {}", request->filename));
        }
        requests.push_back(std::move(request));
    }

    return batch(context, workers, std::move(requests));
}

std::shared_ptr<ResponseChannel> Client::batch(const Context& context, std::size_t workers,
                                               std::vector<RequestPtr> requests) {
    for (const auto& request : requests) {
        if (!request) {
            throw Error(ErrorKind::InvalidRequest, "Batch contains a null request");
        }
    }

    auto results = std::make_shared<ResponseChannel>();
    spawn([this, context, workers, requests = std::move(requests), results]() mutable {
        dispatch(context, workers, std::move(requests), results);
    });
    return results;
}

Client::Worker Client::launch(std::function<void()> task) {
    Worker worker;
    worker.done = std::make_shared<std::atomic<bool>>(false);
    worker.thread = std::thread([task = std::move(task), done = worker.done] {
        task();
        done->store(true, std::memory_order_release);
    });
    return worker;
}

void Client::reapFinished(std::vector<Worker>& workers) {
    auto it = workers.begin();
    while (it != workers.end()) {
        if (it->done->load(std::memory_order_acquire)) {
            it->thread.join();
            it = workers.erase(it);
        } else {
            ++it;
        }
    }
}

void Client::spawn(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    reapFinished(threads_);
    threads_.push_back(launch(std::move(task)));
}

std::size_t Client::backgroundThreads() const {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    return threads_.size();
}

void Client::dispatch(const Context& context, std::size_t workers,
                      std::vector<RequestPtr> requests,
                      const std::shared_ptr<ResponseChannel>& results) {
    // every transfer reports here exactly once when it is finalized
    auto finished = std::make_shared<ResponseChannel>();
    std::vector<Worker> threads;
    std::size_t active = 0;

    const auto collect = [&] {
        if (auto response = finished->receive()) {
            results->send(std::move(*response));
        }
        --active;
    };

    for (const auto& request : requests) {
        if (workers > 0 && active >= workers) {
            collect();
        }

        ++active;
        auto response = prepare(request, finished);
        reapFinished(threads);
        try {
            threads.push_back(launch([this, response, context] { perform(*response, context); }));
        } catch (const std::system_error& ex) {
            spdlog::warn("Cannot start a thread for {}, running inline: {}", request->url,
                         ex.what());
            perform(*response, context);
        }
    }

    while (active > 0) {
        collect();
    }

    for (auto& worker : threads) {
        worker.thread.join();
    }
    results->close();
    spdlog::debug("Batch of {} transfers finished", requests.size());
}

ResponsePtr Client::prepare(const RequestPtr& request,
                            std::shared_ptr<ResponseChannel> internal_sink) const {
    if (!request) {
        throw std::invalid_argument("Cannot execute a null request");
    }

    auto response = std::make_shared<Response>(request);
    response->buffer_size_ = options_.buffer_size;
    response->internal_sink_ = std::move(internal_sink);
    return response;
}

void Client::perform(Response& response, const Context& context) {
    const Request& request = *response.request();
    spdlog::debug("Starting {} -> {}", request.url, request.filename);

    try {
        transfer(response, context);
    } catch (const Error& err) {
        response.close(err);
    } catch (const std::exception& ex) {
        response.close(Error(ErrorKind::Internal, ex.what()));
    }

    // the response is complete here, so its error is safe to read
    if (const auto& err = response.error()) {
        spdlog::debug("Download of {} failed ({}): {}", request.url, toString(err->kind()),
                      err->what());
    } else {
        spdlog::debug("Finished {} ({} bytes)", request.filename, response.bytesTransferred());
    }
}

void Client::transfer(Response& response, const Context& context) {
    const Request& request = *response.request_;
    if (context.cancelled()) {
        throw Error(ErrorKind::Cancelled,
                    fmt::format("Transfer of {} cancelled before start", request.url));
    }
    if (request.filename.empty()) {
        throw Error(ErrorKind::InvalidRequest,
                    fmt::format("No destination filename for {}", request.url));
    }

    const std::uint64_t offset = request.no_resume ? 0 : existingSize(request.filename);
    TransportResponse reply = transport_->open(request, offset, context);
    response.status_code_ = reply.status_code;
    response.content_length_ = reply.content_length;
    response.headers_ = std::move(reply.headers);

    if (offset > 0 && reply.status_code == kRangeNotSatisfiable) {
        spdlog::debug("{} is already complete ({} bytes)", request.filename, offset);
        response.did_resume_ = true;
        response.size_.store(offset, std::memory_order_release);
        response.bytes_transferred_.store(offset, std::memory_order_release);
        response.writer_ = openDestination(request.filename, "ab");
        MemoryBody empty;
        response.copy(empty);
        return;
    }

    if (!isSuccessStatus(reply.status_code)) {
        throw Error(ErrorKind::BadStatus,
                    fmt::format("Server returned status {} for {}", reply.status_code,
                                request.url));
    }
    if (!reply.body) {
        throw Error(ErrorKind::Internal,
                    fmt::format("Transport returned no body for {}", request.url));
    }

    const bool resumed = offset > 0 && (reply.status_code == 206 || reply.status_code == 0);
    if (offset > 0 && !resumed) {
        spdlog::debug("Server ignored range for {}, restarting", request.url);
    }

    const std::uint64_t start = resumed ? offset : 0;
    response.did_resume_ = resumed;
    response.size_.store(reply.content_length > 0 ? start + reply.content_length : 0,
                         std::memory_order_release);
    response.bytes_transferred_.store(start, std::memory_order_release);
    response.writer_ = openDestination(request.filename, resumed ? "ab" : "wb");
    response.copy(*reply.body);
}

} // namespace batchdl
