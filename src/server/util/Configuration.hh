/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 1/6/18.
//

#pragma once

#include "common/FS.hh"
#include "common/util/Exception.hh"

#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/exception/error_info.hpp>

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>
#include <variant>

namespace imagio {

struct FileStorageSetting
{
	fs::path root;
};

struct S3StorageSetting
{
	std::string region;
	std::string bucket;
	std::string endpoint;       //!< e.g. "https://s3.us-east-1.amazonaws.com" or "http://127.0.0.1:9000"
	std::string access_key;
	std::string secret_key;
	std::string prefix;         //!< prepended to every key
	std::chrono::seconds timeout{30};
};

using StorageSetting = std::variant<FileStorageSetting, S3StorageSetting>;

/// What to do when a freshly rendered derivative cannot be written to the cache
enum class WriteThrough
{
	strict,     //!< fail the request
	lenient     //!< log, and return the rendered bytes anyway
};

struct CacheSetting
{
	int             jpeg_quality{85};
	WriteThrough    write_through{WriteThrough::strict};
	bool            deduplicate{true};
	std::size_t     thread_count{1};
};

struct MetadataSetting
{
	std::string     connection;     //!< libpq connection string. Empty means in-memory.
	std::size_t     pool_size{4};
};

/// \brief  Parsing command line options and configuration file
class Configuration
{
public:
	struct Error : virtual Exception {};
	struct FileError : virtual Error {};
	struct InvalidValue : virtual Error {};
	using Path      = boost::error_info<struct tag_path,    boost::filesystem::path>;
	using Message   = boost::error_info<struct tag_message, std::string>;
	using Field     = boost::error_info<struct tag_field,   std::string>;
	using Offset    = boost::error_info<struct tag_offset,  std::size_t>;
	using ErrorCode = boost::error_info<struct tag_error_code,  std::error_code>;

public:
	Configuration() = default;
	Configuration(int argc, const char *const *argv, const char *env);

	[[nodiscard]] const StorageSetting& originals() const {return m_originals;}
	[[nodiscard]] const StorageSetting& derivatives() const {return m_derivatives;}
	[[nodiscard]] const MetadataSetting& metadata() const {return m_metadata;}
	[[nodiscard]] const CacheSetting& cache() const {return m_cache;}

	bool help() const {return m_args.count("help") > 0;}
	bool init() const {return m_args.count("init") > 0;}

	// Runs the function if the command line option is given, passing its argument.
	template <typename Function>
	bool command(const char *option, Function&& func) const
	{
		return m_args.count(option) > 0 ?
			(func(m_args[option].as<std::string>()), true) :
			false;
	}

	[[nodiscard]] std::string category() const;
	[[nodiscard]] std::string variant() const;
	[[nodiscard]] std::optional<fs::path> output() const;
	[[nodiscard]] std::size_t limit() const;
	[[nodiscard]] std::size_t skip() const;

	void usage(std::ostream& out) const;

	static StorageSetting parse_storage(const nlohmann::json& json);

	// for unit tests
	void originals(StorageSetting setting) {m_originals = std::move(setting);}
	void derivatives(StorageSetting setting) {m_derivatives = std::move(setting);}

private:
	void load_config(const boost::filesystem::path& path);

private:
	boost::program_options::options_description m_desc{"Allowed options"};
	boost::program_options::variables_map       m_args;

	StorageSetting  m_originals, m_derivatives;
	MetadataSetting m_metadata;
	CacheSetting    m_cache;
};

} // end of namespace
