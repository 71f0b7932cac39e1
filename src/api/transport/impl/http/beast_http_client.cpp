#include "api/transport/impl/http/beast_http_client.hpp"

#include <functional>
#include <optional>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include "api/transport/error.hpp"

namespace chainrelay::api
{
    namespace
    {
        namespace beast = boost::beast;
        namespace http  = boost::beast::http;
        namespace ssl   = boost::asio::ssl;
        using tcp       = boost::asio::ip::tcp;
        using ErrorCode = boost::system::error_code;
        using Deadline  = std::chrono::steady_clock::time_point;
        using Done      = std::function<void( const ErrorCode & )>;

        /// Runs one asynchronous step until it completes or the deadline passes
        std::optional<ErrorCode> runStep( boost::asio::io_context &ioc, Deadline deadline,
                                          const std::function<void( Done )> &start )
        {
            std::optional<ErrorCode> result;
            start( [&result]( const ErrorCode &ec ) { result = ec; } );
            ioc.restart();
            while ( !result && std::chrono::steady_clock::now() < deadline )
            {
                if ( ioc.run_one_until( deadline ) == 0 )
                {
                    break;
                }
            }
            return result;
        }

        bool isTimeout( const ErrorCode &ec )
        {
            return ec == beast::error::timeout || ec == boost::asio::error::timed_out;
        }

        template <typename Stream>
        outcome::result<HttpResponse> exchange( boost::asio::io_context &ioc, Deadline deadline, Stream &stream,
                                                http::request<http::string_body> &req, const base::Logger &logger )
        {
            auto written = runStep( ioc, deadline,
                                    [&]( Done done )
                                    {
                                        http::async_write( stream, req,
                                                           [done]( const ErrorCode &ec, std::size_t ) { done( ec ); } );
                                    } );
            if ( !written || isTimeout( *written ) )
            {
                return HttpError::TIMEOUT;
            }
            if ( *written )
            {
                logger->debug( "Write failed: {}", written->message() );
                return HttpError::IO_FAILED;
            }

            beast::flat_buffer                  buffer;
            http::response<http::string_body>   res;
            auto read = runStep( ioc, deadline,
                                 [&]( Done done )
                                 {
                                     http::async_read( stream, buffer, res,
                                                       [done]( const ErrorCode &ec, std::size_t ) { done( ec ); } );
                                 } );
            if ( !read || isTimeout( *read ) )
            {
                return HttpError::TIMEOUT;
            }
            if ( *read )
            {
                logger->debug( "Read failed: {}", read->message() );
                return HttpError::IO_FAILED;
            }

            HttpResponse response;
            response.status = res.result_int();
            response.body   = std::move( res.body() );
            return response;
        }
    } // namespace

    outcome::result<HttpResponse> BeastHttpClient::get( const std::string &url, std::chrono::milliseconds timeout )
    {
        return request( http::verb::get, url, "", timeout );
    }

    outcome::result<HttpResponse> BeastHttpClient::post( const std::string &url, const std::string &body,
                                                         std::chrono::milliseconds timeout )
    {
        return request( http::verb::post, url, body, timeout );
    }

    outcome::result<HttpResponse> BeastHttpClient::request( http::verb verb, const std::string &url,
                                                            const std::string &body,
                                                            std::chrono::milliseconds timeout )
    {
        auto parsed = parseUrl( url );
        if ( !parsed )
        {
            return parsed.as_failure();
        }
        const auto &target   = parsed.value();
        const auto  deadline = std::chrono::steady_clock::now() + timeout;

        try
        {
            boost::asio::io_context ioc;

            tcp::resolver               resolver( ioc );
            tcp::resolver::results_type endpoints;
            auto resolved = runStep( ioc, deadline,
                                     [&]( Done done )
                                     {
                                         resolver.async_resolve(
                                             target.host, target.port,
                                             [&endpoints, done]( const ErrorCode &ec, tcp::resolver::results_type results )
                                             {
                                                 endpoints = std::move( results );
                                                 done( ec );
                                             } );
                                     } );
            if ( !resolved )
            {
                return HttpError::TIMEOUT;
            }
            if ( *resolved )
            {
                logger_->debug( "Resolve {} failed: {}", target.host, resolved->message() );
                return HttpError::RESOLVE_FAILED;
            }

            http::request<http::string_body> req{ verb, target.target, 11 };
            req.set( http::field::host, target.host );
            req.set( http::field::user_agent, BOOST_BEAST_VERSION_STRING );
            req.set( http::field::accept, "application/json" );
            if ( verb == http::verb::post )
            {
                req.set( http::field::content_type, "application/json" );
                req.body() = body;
            }
            req.keep_alive( false );
            req.prepare_payload();

            auto connect = [&]( beast::tcp_stream &tcp_stream ) -> std::optional<ErrorCode>
            {
                tcp_stream.expires_at( deadline );
                return runStep( ioc, deadline,
                                [&]( Done done )
                                {
                                    tcp_stream.async_connect( endpoints,
                                                              [done]( const ErrorCode &ec, const tcp::endpoint & )
                                                              { done( ec ); } );
                                } );
            };

            if ( !target.secure )
            {
                beast::tcp_stream stream( ioc );
                auto              connected = connect( stream );
                if ( !connected || isTimeout( *connected ) )
                {
                    return HttpError::TIMEOUT;
                }
                if ( *connected )
                {
                    logger_->debug( "Connect to {}:{} failed: {}", target.host, target.port, connected->message() );
                    return HttpError::CONNECT_FAILED;
                }
                auto result = exchange( ioc, deadline, stream, req, logger_ );
                ErrorCode ignored;
                stream.socket().shutdown( tcp::socket::shutdown_both, ignored );
                return result;
            }

            ssl::context ctx( ssl::context::tlsv12_client );
            ctx.set_default_verify_paths();
            ctx.set_verify_mode( ssl::verify_peer );

            beast::ssl_stream<beast::tcp_stream> stream( ioc, ctx );
            // SNI
            if ( !SSL_set_tlsext_host_name( stream.native_handle(), target.host.c_str() ) )
            {
                logger_->debug( "Cannot set SNI host name {}", target.host );
                return HttpError::TLS_HANDSHAKE_FAILED;
            }
            stream.set_verify_callback( ssl::host_name_verification( target.host ) );

            auto connected = connect( beast::get_lowest_layer( stream ) );
            if ( !connected || isTimeout( *connected ) )
            {
                return HttpError::TIMEOUT;
            }
            if ( *connected )
            {
                logger_->debug( "Connect to {}:{} failed: {}", target.host, target.port, connected->message() );
                return HttpError::CONNECT_FAILED;
            }

            auto handshake = runStep( ioc, deadline,
                                      [&]( Done done )
                                      { stream.async_handshake( ssl::stream_base::client, done ); } );
            if ( !handshake || isTimeout( *handshake ) )
            {
                return HttpError::TIMEOUT;
            }
            if ( *handshake )
            {
                logger_->debug( "TLS handshake with {} failed: {}", target.host, handshake->message() );
                return HttpError::TLS_HANDSHAKE_FAILED;
            }

            auto result = exchange( ioc, deadline, stream, req, logger_ );
            beast::get_lowest_layer( stream ).close();
            return result;
        }
        catch ( const boost::system::system_error &e )
        {
            logger_->error( "HTTP request to {} failed: {}", target.host, e.what() );
            return HttpError::IO_FAILED;
        }
    }
} // namespace chainrelay::api
