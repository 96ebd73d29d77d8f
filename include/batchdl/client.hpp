#pragma once

#include "context.hpp"
#include "options.hpp"
#include "request.hpp"
#include "response.hpp"
#include "transport.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace batchdl {

class Client {
public:
    explicit Client(ClientOptions options = {});
    Client(ClientOptions options, std::shared_ptr<Transport> transport);

    // Waits for every transfer and batch started by this client to finish.
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Runs one transfer to completion on the calling thread. Never throws for
    // transfer failures: the returned Response is always complete and carries
    // any error.
    ResponsePtr execute(const RequestPtr& request, const Context& context = Context{});

    // Starts one transfer on a background thread and returns its Response
    // immediately, so that progress can be observed while it runs.
    ResponsePtr start(const RequestPtr& request, const Context& context = Context{});

    // Downloads `url` into `destination_dir`. Throws Error(InvalidRequest) if
    // the URL is invalid.
    ResponsePtr get(const std::string& destination_dir, const std::string& url,
                    const Context& context = Context{});

    // Downloads every URL into `destination_dir` with at most `workers`
    // transfers active at once (0 for no limit). The returned channel yields
    // exactly one finished Response per URL in completion order and is closed
    // afterwards. Throws Error(InvalidRequest) before starting anything if a
    // URL is invalid, the destination is not a directory, or two URLs map to
    // the same file.
    std::shared_ptr<ResponseChannel> batch(const Context& context, std::size_t workers,
                                           const std::string& destination_dir,
                                           const std::vector<std::string>& urls);

    std::shared_ptr<ResponseChannel> batch(const Context& context, std::size_t workers,
                                           std::vector<RequestPtr> requests);

    [[nodiscard]] const ClientOptions& options() const noexcept { return options_; }

    // Background threads not yet joined. Finished threads are joined the next
    // time one is started.
    [[nodiscard]] std::size_t backgroundThreads() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    static Worker launch(std::function<void()> task);
    static void reapFinished(std::vector<Worker>& workers);

    ResponsePtr prepare(const RequestPtr& request,
                        std::shared_ptr<ResponseChannel> internal_sink) const;
    void perform(Response& response, const Context& context);
    void transfer(Response& response, const Context& context);
    void spawn(std::function<void()> task);
    void dispatch(const Context& context, std::size_t workers, std::vector<RequestPtr> requests,
                  const std::shared_ptr<ResponseChannel>& results);

    ClientOptions options_;
    std::shared_ptr<Transport> transport_;

    mutable std::mutex threads_mutex_;
    std::vector<Worker> threads_;
};

} // namespace batchdl
