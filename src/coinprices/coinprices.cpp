#include "coinprices.hpp"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include "api/transport/error.hpp"
OUTCOME_CPP_DEFINE_CATEGORY_3( chainrelay::coinprices, PriceError, e )
{
    switch ( e )
    {
        case chainrelay::coinprices::PriceError::EmptyInput:
            return "Empty Input";
        case chainrelay::coinprices::PriceError::NetworkError:
            return "Network Error";
        case chainrelay::coinprices::PriceError::Timeout:
            return "Price feed timed out";
        case chainrelay::coinprices::PriceError::HttpStatus:
            return "Price feed answered with a non-2xx status";
        case chainrelay::coinprices::PriceError::JsonParseError:
            return "Json Parse Error";
        case chainrelay::coinprices::PriceError::NoDataFound:
            return "No Data";
        case chainrelay::coinprices::PriceError::RateLimitExceeded:
            return "Rate limit exceeded";
    }
    return "Unknown error";
}
namespace chainrelay::coinprices
{
    CoinGeckoPriceRetriever::CoinGeckoPriceRetriever( std::shared_ptr<api::HttpClient> http,
                                                      std::chrono::milliseconds timeout, std::string baseUrl ) :
        m_http( std::move( http ) ), m_timeout( timeout ), m_baseUrl( std::move( baseUrl ) )
    {
    }

    outcome::result<std::map<std::string, double>> CoinGeckoPriceRetriever::getCurrentPrices(
        const std::vector<std::string> &tokenIds )
    {
        std::map<std::string, double> prices;

        if ( tokenIds.empty() )
        {
            return outcome::failure( PriceError::EmptyInput );
        }

        // Join the token IDs with commas for the API request
        std::string tokenIdsList;
        for ( size_t i = 0; i < tokenIds.size(); i++ )
        {
            tokenIdsList += tokenIds[i];
            if ( i < tokenIds.size() - 1 )
            {
                tokenIdsList += ",";
            }
        }
        m_logger->debug( "Token IDS: {}", tokenIdsList );

        std::string url      = m_baseUrl + "/simple/price?ids=" + tokenIdsList + "&vs_currencies=usd";
        auto        response = m_http->get( url, m_timeout );
        if ( !response )
        {
            m_logger->error( "Error getting current prices: {}", response.error().message() );
            if ( response.error() == api::HttpError::TIMEOUT )
            {
                return outcome::failure( PriceError::Timeout );
            }
            return outcome::failure( PriceError::NetworkError );
        }

        const auto &res = response.value();
        m_logger->debug( "Res Is: {} {}", res.status, res.body );
        if ( res.status == 429 )
        {
            return outcome::failure( PriceError::RateLimitExceeded );
        }
        if ( res.status < 200 || res.status >= 300 )
        {
            m_logger->error( "Price feed returned HTTP {}", res.status );
            return outcome::failure( PriceError::HttpStatus );
        }

        // Parse the JSON response
        rapidjson::Document document;
        document.Parse( res.body.c_str() );

        if ( document.HasParseError() || !document.IsObject() )
        {
            m_logger->error( "JSON Parse Error: {}", rapidjson::GetParseError_En( document.GetParseError() ) );
            return outcome::failure( PriceError::JsonParseError );
        }

        // Check if the response contains an error message about rate limits
        if ( document.HasMember( "status" ) && document["status"].IsObject() &&
             document["status"].HasMember( "error_code" ) && document["status"]["error_code"].IsInt() )
        {
            int error_code = document["status"]["error_code"].GetInt();
            if ( error_code == 429 )
            {
                return outcome::failure( PriceError::RateLimitExceeded );
            }
        }

        // Extract the prices for each token
        for ( const auto &tokenId : tokenIds )
        {
            if ( document.HasMember( tokenId.c_str() ) && document[tokenId.c_str()].IsObject() &&
                 document[tokenId.c_str()].HasMember( "usd" ) && document[tokenId.c_str()]["usd"].IsNumber() )
            {
                prices[tokenId] = document[tokenId.c_str()]["usd"].GetDouble();
            }
        }

        if ( prices.empty() )
        {
            return outcome::failure( PriceError::NoDataFound );
        }

        return outcome::success( prices );
    }
}
