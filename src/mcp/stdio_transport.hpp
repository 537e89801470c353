#pragma once

// ---------------------------------------------------------------------------
// stdio_transport.hpp
//
// 줄 단위 JSON-RPC 전송 (stdin → handler → stdout).
//
// [프레이밍]
// - 한 줄에 메시지 하나 (UTF-8, '\n' 구분, 끝의 '\r' 은 제거).
// - 빈 줄/공백 줄은 무시한다.
// - 응답을 완전히 쓴 뒤에야 다음 줄을 읽는다 (요청 순서 = 응답 순서).
// - EOF 면 루프를 정상 종료한다. 개행 없이 끝난 마지막 줄도 처리한다.
// - 한 줄이 max_line_bytes 를 넘으면 id:null 인 -32600 오류를 쓰고 세션을 끝낸다.
//
// [취소]
// stop() 또는 run() 에 넘긴 stop_token 은 대기 중인 read 를 취소한다.
// 처리 중이던 요청의 응답은 쓰지 않는다 (부분 응답 없음).
// stop() 은 취소 작업을 실행기에 post 하므로 transport 는 io_context 가
// 멈출 때까지 살아 있어야 한다.
// ---------------------------------------------------------------------------

#include "mcp/json_rpc_handler.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>

#include <unistd.h>

struct StdioTransportOptions {
    int         in_fd{STDIN_FILENO};
    int         out_fd{STDOUT_FILENO};
    std::size_t max_line_bytes{4 * 1024 * 1024};
};

class StdioTransport {
public:
    // fd 는 dup() 하여 소유한다. 호출자의 fd 는 닫지 않는다.
    StdioTransport(boost::asio::any_io_executor    executor,
                   std::shared_ptr<JsonRpcHandler> handler,
                   StdioTransportOptions           options = {});

    ~StdioTransport() = default;

    StdioTransport(const StdioTransport&)            = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;
    StdioTransport(StdioTransport&&)                 = delete;
    StdioTransport& operator=(StdioTransport&&)      = delete;

    // run
    //   EOF, stop 요청, 또는 I/O 오류까지 요청을 처리한다.
    boost::asio::awaitable<void> run(std::stop_token stop = {});

    // stop
    //   대기 중인 read 를 취소한다. 스레드 안전.
    void stop();

    [[nodiscard]] std::uint64_t processed_lines() const noexcept {
        return processed_lines_.load(std::memory_order_relaxed);
    }

private:
    boost::asio::any_io_executor          executor_;
    std::shared_ptr<JsonRpcHandler>       handler_;
    StdioTransportOptions                 options_;
    boost::asio::posix::stream_descriptor input_;
    boost::asio::posix::stream_descriptor output_;
    std::stop_source                      stop_source_{};
    std::atomic<std::uint64_t>            processed_lines_{0};

    // process_line
    //   false 면 루프를 끝낸다 (취소 또는 쓰기 실패).
    boost::asio::awaitable<bool> process_line(std::string line);

    // write_response
    //   JSON 한 줄을 쓴다. 쓰기 실패 시 false.
    boost::asio::awaitable<bool> write_response(const nlohmann::json& response);
};
