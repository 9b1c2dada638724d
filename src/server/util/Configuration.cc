/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 1/6/18.
//

#include "Configuration.hh"

#include "config.hh"

#include <nlohmann/json.hpp>

#include <boost/program_options.hpp>
#include <boost/exception/info.hpp>
#include <boost/exception/diagnostic_information.hpp>

#include <cstdint>
#include <fstream>

namespace po = boost::program_options;

namespace imagio {
namespace {

using jptr = nlohmann::json::json_pointer;

template <typename T>
T required(const nlohmann::json& json, const char *field)
{
	if (!json.contains(field))
		BOOST_THROW_EXCEPTION(Configuration::InvalidValue()
			<< Configuration::Field{field}
			<< Configuration::Message{"missing required field"}
		);
	return json[field].get<T>();
}

std::size_t positive_count(const nlohmann::json& json, const jptr& field, std::size_t fallback)
{
	// read as signed so that negative values are rejected instead of wrapped around
	auto count = json.value(field, static_cast<std::int64_t>(fallback));
	if (count < 1)
		BOOST_THROW_EXCEPTION(Configuration::InvalidValue()
			<< Configuration::Field{field.back()}
			<< Configuration::Message{"must be a positive integer"}
		);
	return static_cast<std::size_t>(count);
}

StorageSetting parse_filesystem(const nlohmann::json& json)
{
	fs::path root{required<std::string>(json, "root")};
	if (!root.is_absolute())
		BOOST_THROW_EXCEPTION(Configuration::InvalidValue()
			<< Configuration::Field{"root"}
			<< Configuration::Message{"storage root must be an absolute path: " + root.string()}
		);

	return FileStorageSetting{root.lexically_normal()};
}

StorageSetting parse_s3(const nlohmann::json& json)
{
	S3StorageSetting s3;
	s3.region     = required<std::string>(json, "region");
	s3.bucket     = required<std::string>(json, "bucket");
	s3.access_key = required<std::string>(json, "access_key");
	s3.secret_key = required<std::string>(json, "secret_key");
	s3.endpoint   = json.value("endpoint", "https://s3." + s3.region + ".amazonaws.com");
	s3.prefix     = json.value("prefix", std::string{});
	s3.timeout    = std::chrono::seconds{json.value("timeout_sec", s3.timeout.count())};

	if (s3.bucket.empty() || s3.region.empty())
		BOOST_THROW_EXCEPTION(Configuration::InvalidValue()
			<< Configuration::Message{"S3 bucket and region must not be empty"}
		);
	if (s3.endpoint.rfind("http://", 0) != 0 && s3.endpoint.rfind("https://", 0) != 0)
		BOOST_THROW_EXCEPTION(Configuration::InvalidValue()
			<< Configuration::Field{"endpoint"}
			<< Configuration::Message{"S3 endpoint must start with http:// or https://"}
		);
	if (s3.timeout.count() <= 0)
		BOOST_THROW_EXCEPTION(Configuration::InvalidValue()
			<< Configuration::Field{"timeout_sec"}
			<< Configuration::Message{"timeout must be positive"}
		);

	return s3;
}

} // end of local namespace

Configuration::Configuration(int argc, const char *const *argv, const char *env)
{
	using namespace std::literals;
	m_desc.add_options()
		("help",      "produce help message")
		("cfg",       po::value<std::string>()->default_value(
			env ? std::string{env} : std::string{imagio::constants::config_filename}
		)->value_name("path"), "Configuration file. Use environment variable IMAGIO_CONFIG to set default path.")
		("init",      "create the metadata tables if they do not exist")
		("upload",    po::value<std::string>()->value_name("file"), "upload an image file to the category given by --category")
		("get",       po::value<std::string>()->value_name("uuid"), "print the metadata of an image")
		("list",      po::value<std::string>()->value_name("category"), "list the images of a category, newest first")
		("resolve",   po::value<std::string>()->value_name("uuid"), "render a variant of an image to the file given by --output")
		("delete",    po::value<std::string>()->value_name("uuid"), "delete an image")
		("generate",  po::value<std::string>()->value_name("category"), "generate all variants of all images in a category")
		("category",  po::value<std::string>()->default_value("public")->value_name("name"), "category of the uploaded image")
		("variant",   po::value<std::string>()->default_value("original")->value_name("name"), "variant to resolve: original, public, embed, thumb, banner or square")
		("output",    po::value<std::string>()->value_name("file"), "destination of --resolve")
		("limit",     po::value<std::size_t>()->default_value(20), "maximum number of images listed")
		("skip",      po::value<std::size_t>()->default_value(0), "number of images skipped before listing")
	;

	if (argc > 0)
	{
		store(po::parse_command_line(argc, argv, m_desc), m_args);
		po::notify(m_args);
	}

	// no need for other options when --help is specified
	if (!help())
		load_config(
			m_args.count("cfg") > 0 ? m_args["cfg"].as<std::string>() : std::string{env ? env : ""}
		);
}

void Configuration::usage(std::ostream &out) const
{
	out << m_desc;
}

StorageSetting Configuration::parse_storage(const nlohmann::json& json)
{
	if (!json.is_object())
		BOOST_THROW_EXCEPTION(InvalidValue() << Message{"storage setting must be an object"});

	auto backend = required<std::string>(json, "backend");
	if (backend == "filesystem")
		return parse_filesystem(json);
	else if (backend == "s3")
		return parse_s3(json);
	else
		BOOST_THROW_EXCEPTION(InvalidValue()
			<< Field{"backend"}
			<< Message{"unknown storage backend \"" + backend + "\""}
		);
}

void Configuration::load_config(const boost::filesystem::path& path)
{
	try
	{
		std::ifstream config_file;
		config_file.open(path.string(), std::ios::in);
		if (!config_file)
		{
			BOOST_THROW_EXCEPTION(FileError()
				<< ErrorCode({errno, std::system_category()})
			);
		}

		auto json = nlohmann::json::parse(config_file);

		m_originals   = parse_storage(json.at(jptr{"/originals"}));
		m_derivatives = parse_storage(json.at(jptr{"/derivatives"}));

		m_metadata.connection = json.value(jptr{"/metadata/connection"}, m_metadata.connection);
		m_metadata.pool_size  = positive_count(json, jptr{"/metadata/pool_size"}, m_metadata.pool_size);

		m_cache.jpeg_quality = json.value(jptr{"/jpeg_quality"}, m_cache.jpeg_quality);
		if (m_cache.jpeg_quality < 1 || m_cache.jpeg_quality > 100)
			BOOST_THROW_EXCEPTION(InvalidValue() << Field{"jpeg_quality"} << Message{"JPEG quality must be within 1 to 100"});

		auto write_through = json.value(jptr{"/write_through"}, std::string{"strict"});
		if (write_through == "strict")
			m_cache.write_through = WriteThrough::strict;
		else if (write_through == "lenient")
			m_cache.write_through = WriteThrough::lenient;
		else
			BOOST_THROW_EXCEPTION(InvalidValue() << Field{"write_through"} << Message{"expect \"strict\" or \"lenient\""});

		m_cache.deduplicate  = json.value(jptr{"/deduplicate"},  m_cache.deduplicate);
		m_cache.thread_count = positive_count(json, jptr{"/thread_count"}, m_cache.thread_count);
	}
	catch (nlohmann::json::exception& e)
	{
		BOOST_THROW_EXCEPTION(Error()
			<< Message{e.what()}
			<< Path{path}
		);
	}
	catch (Exception& e)
	{
		e << Path{path};
		throw;
	}
}

std::string Configuration::category() const
{
	return m_args.count("category") > 0 ? m_args["category"].as<std::string>() : std::string{"public"};
}

std::string Configuration::variant() const
{
	return m_args.count("variant") > 0 ? m_args["variant"].as<std::string>() : std::string{"original"};
}

std::optional<fs::path> Configuration::output() const
{
	if (m_args.count("output") > 0)
		return fs::path{m_args["output"].as<std::string>()};
	return std::nullopt;
}

std::size_t Configuration::limit() const
{
	return m_args.count("limit") > 0 ? m_args["limit"].as<std::size_t>() : 20;
}

std::size_t Configuration::skip() const
{
	return m_args.count("skip") > 0 ? m_args["skip"].as<std::size_t>() : 0;
}

} // end of namespace
