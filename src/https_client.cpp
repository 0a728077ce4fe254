#include "https_client.hpp"

#include <algorithm>

std::shared_ptr<HttpsExchange> HttpsExchange::start(asio::io_context& io,
                                                    asio::ssl::context& tls,
                                                    HttpsRequest request,
                                                    std::chrono::milliseconds timeout,
                                                    Handler handler,
                                                    std::shared_ptr<Logger> logger)
{
    auto exchange = std::shared_ptr<HttpsExchange>(
        new HttpsExchange(io, tls, std::move(request), timeout, std::move(handler), std::move(logger)));
    exchange->run();
    return exchange;
}

HttpsExchange::HttpsExchange(asio::io_context& io,
                             asio::ssl::context& tls,
                             HttpsRequest request,
                             std::chrono::milliseconds timeout,
                             Handler handler,
                             std::shared_ptr<Logger> logger)
: stream_(io, tls),
  deadline_(io),
  request_(std::move(request)),
  timeout_(timeout),
  handler_(std::move(handler)),
  logger_(std::move(logger)),
  read_buf_(kMaxResponseBytes)
{
}

void HttpsExchange::run(){
    if(!request_.body_file.empty()){
        std::error_code ec;
        file_remaining_ = std::filesystem::file_size(request_.body_file, ec);
        if(!ec) file_.open(request_.body_file, std::ios::binary);
        if(ec || !file_){
            std::string error = "cannot read " + request_.body_file.string() +
                                (ec ? ": " + ec.message() : std::string());
            auto self = shared_from_this();
            asio::post(stream_.get_executor(), [self, error](){ self->complete(error); });
            return;
        }
    }
    do_connect();
}

void HttpsExchange::arm_deadline(){
    deadline_.expires_after(timeout_);
    std::weak_ptr<HttpsExchange> weak = shared_from_this();
    deadline_.async_wait([weak](const std::error_code& ec){
        auto self = weak.lock();
        if(ec || !self || self->done_) return;
        self->timed_out_ = true;
        std::error_code ignored;
        self->stream_.lowest_layer().close(ignored);
    });
}

void HttpsExchange::do_connect(){
    arm_deadline();
    auto self = shared_from_this();
    stream_.lowest_layer().async_connect(request_.endpoint,
        [this, self](std::error_code ec){
            if(ec){
                complete(describe_error("connect", ec));
                return;
            }
            do_handshake();
        });
}

void HttpsExchange::do_handshake(){
    arm_deadline();
    auto self = shared_from_this();
    stream_.async_handshake(asio::ssl::stream_base::client,
        [this, self](std::error_code ec){
            if(ec){
                complete(describe_error("TLS handshake", ec));
                return;
            }
            do_write_head();
        });
}

void HttpsExchange::do_write_head(){
    HttpRequest head;
    head.method = request_.method;
    head.target = request_.target;
    head.headers.emplace_back("Host", request_.endpoint.address().to_string() + ":" +
                                      std::to_string(request_.endpoint.port()));
    head.headers.emplace_back("User-Agent", "localshare");
    const bool streaming = !request_.body_file.empty();
    const uint64_t length = streaming ? file_remaining_ : request_.body.size();
    if(streaming || !request_.body.empty()){
        head.headers.emplace_back("Content-Type", request_.content_type);
    }
    head.headers.emplace_back("Content-Length", std::to_string(length));
    head.headers.emplace_back("Connection", "close");

    head_ = head.serialize_head();
    if(!streaming) head_ += request_.body;

    arm_deadline();
    auto self = shared_from_this();
    asio::async_write(stream_, asio::buffer(head_),
        [this, self, streaming](std::error_code ec, std::size_t){
            if(ec){
                complete(describe_error("send request", ec));
                return;
            }
            if(streaming){
                chunk_.resize(kChunkSize);
                do_write_file_chunk();
            } else {
                do_read_head();
            }
        });
}

void HttpsExchange::do_write_file_chunk(){
    if(file_remaining_ == 0){
        do_read_head();
        return;
    }
    const auto want = static_cast<std::size_t>(std::min<uint64_t>(file_remaining_, chunk_.size()));
    file_.read(chunk_.data(), static_cast<std::streamsize>(want));
    if(static_cast<std::size_t>(file_.gcount()) != want){
        complete("error reading " + request_.body_file.string());
        return;
    }

    arm_deadline();
    auto self = shared_from_this();
    asio::async_write(stream_, asio::buffer(chunk_.data(), want),
        [this, self](std::error_code ec, std::size_t written){
            if(ec){
                complete(describe_error("send file data", ec));
                return;
            }
            file_remaining_ -= written;
            do_write_file_chunk();
        });
}

void HttpsExchange::do_read_head(){
    arm_deadline();
    auto self = shared_from_this();
    asio::async_read_until(stream_, read_buf_, kHeaderTerminator,
        [this, self](std::error_code ec, std::size_t head_bytes){
            if(ec){
                complete(describe_error("read response", ec));
                return;
            }
            auto begin = asio::buffers_begin(read_buf_.data());
            std::string head(begin, begin + static_cast<std::ptrdiff_t>(head_bytes));
            read_buf_.consume(head_bytes);
            std::string error;
            if(!parse_response_head(head, response_, error)){
                complete("invalid response: " + error);
                return;
            }
            do_read_body();
        });
}

void HttpsExchange::do_read_body(){
    auto finish_with = [this](std::size_t length){
        auto begin = asio::buffers_begin(read_buf_.data());
        const auto take = std::min(length, read_buf_.size());
        response_.body.assign(begin, begin + static_cast<std::ptrdiff_t>(take));
        complete("");
    };

    if(response_.status == 204 || response_.status == 304){
        finish_with(0);
        return;
    }

    const auto length = response_.content_length();
    if(length && *length < 0){
        complete("invalid response: malformed Content-Length");
        return;
    }
    if(length && static_cast<uint64_t>(*length) > kMaxResponseBytes){
        complete("response body too large");
        return;
    }

    arm_deadline();
    auto self = shared_from_this();
    if(length){
        const auto wanted = static_cast<std::size_t>(*length);
        if(read_buf_.size() >= wanted){
            finish_with(wanted);
            return;
        }
        asio::async_read(stream_, read_buf_, asio::transfer_exactly(wanted - read_buf_.size()),
            [this, self, wanted, finish_with](std::error_code ec, std::size_t){
                if(ec){
                    complete(describe_error("read response body", ec));
                    return;
                }
                finish_with(wanted);
            });
        return;
    }

    // No Content-Length: the body runs until the peer closes.
    asio::async_read(stream_, read_buf_, asio::transfer_all(),
        [this, self, finish_with](std::error_code ec, std::size_t){
            if(ec && ec != asio::error::eof && ec != asio::ssl::error::stream_truncated){
                complete(describe_error("read response body", ec));
                return;
            }
            finish_with(read_buf_.size());
        });
}

void HttpsExchange::cancel(){
    if(done_) return;
    cancelled_ = true;
    std::error_code ignored;
    stream_.lowest_layer().close(ignored);
}

void HttpsExchange::complete(std::string error){
    if(done_) return;
    done_ = true;
    deadline_.cancel();
    std::error_code ignored;
    stream_.lowest_layer().close(ignored);
    if(file_.is_open()) file_.close();

    if(!error.empty()){
        log_debug(logger_.get(), "https {} {} -> {}:{} failed: {}",
                  request_.method, request_.target,
                  request_.endpoint.address().to_string(), request_.endpoint.port(), error);
    }
    auto handler = std::move(handler_);
    handler_ = nullptr;
    if(handler){
        HttpsResult result;
        result.error = std::move(error);
        if(result.ok()) result.response = std::move(response_);
        handler(std::move(result));
    }
}

std::string HttpsExchange::describe_error(const std::string& step, const std::error_code& ec) const{
    if(cancelled_) return step + " cancelled";
    if(timed_out_) return step + " timed out after " + std::to_string(timeout_.count()) + " ms";
    return step + " failed: " + ec.message();
}
