/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

#include "config.hh"

#include "imagio/ImageLibrary.hh"
#include "util/Configuration.hh"

#include "common/Error.hh"
#include "common/util/Exception.hh"
#include "common/util/Log.hh"

#include <boost/exception/info.hpp>
#include <boost/exception/diagnostic_information.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>

namespace imagio {
namespace {

int report(const std::error_code& ec, std::string_view what)
{
	std::cerr << what << ": " << ec.message() << " (HTTP " << static_cast<unsigned>(http_status(ec)) << ")" << std::endl;
	return EXIT_FAILURE;
}

Blob read_file(const fs::path& path)
{
	std::ifstream file{path.string(), std::ios::in | std::ios::binary};
	if (!file)
		BOOST_THROW_EXCEPTION(SystemError()
			<< ErrorCode({errno, std::system_category()})
			<< Configuration::Path{path}
		);
	return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

void write_file(const fs::path& path, BufferView blob)
{
	std::ofstream file{path.string(), std::ios::out | std::ios::binary | std::ios::trunc};
	file.write(reinterpret_cast<const char*>(blob.data()), static_cast<std::streamsize>(blob.size()));
	if (!file)
		BOOST_THROW_EXCEPTION(SystemError()
			<< ErrorCode({errno, std::system_category()})
			<< Configuration::Path{path}
		);
}

int run(const Configuration& cfg)
{
	ImageLibrary lib{cfg};
	std::error_code ec;
	int result = EXIT_SUCCESS;

	if (cfg.init())
	{
		lib.init(ec);
		return ec ? report(ec, "cannot initialize metadata store") : EXIT_SUCCESS;
	}

	else if (cfg.command("upload", [&](auto&& file)
	{
		auto record = lib.upload(cfg.category(), read_file(file), ec);
		result = ec ? report(ec, "cannot upload " + file) : (std::cout << nlohmann::json(record).dump() << std::endl, EXIT_SUCCESS);
	})) {}

	else if (cfg.command("get", [&](auto&& uuid)
	{
		auto record = lib.find(uuid, ec);
		result = ec ? report(ec, uuid) : (std::cout << nlohmann::json(record).dump() << std::endl, EXIT_SUCCESS);
	})) {}

	else if (cfg.command("list", [&](auto&& category)
	{
		auto records = lib.list(category, cfg.limit(), cfg.skip(), ec);
		result = ec ? report(ec, category) : (std::cout << nlohmann::json(records).dump(1, '\t') << std::endl, EXIT_SUCCESS);
	})) {}

	else if (cfg.command("resolve", [&](auto&& uuid)
	{
		auto output = cfg.output();
		if (!output)
		{
			std::cerr << "--output is required for --resolve" << std::endl;
			result = EXIT_FAILURE;
			return;
		}

		auto blob = lib.resolve(uuid, parse_variant(cfg.variant()), ec);
		if (ec)
			result = report(ec, uuid);
		else
			write_file(*output, blob);
	})) {}

	else if (cfg.command("delete", [&](auto&& uuid)
	{
		auto record = lib.remove(uuid, ec);
		result = ec ? report(ec, uuid) : (std::cout << nlohmann::json(record).dump() << std::endl, EXIT_SUCCESS);
	})) {}

	else if (cfg.command("generate", [&](auto&& category)
	{
		auto count = lib.generate(category, ec);
		std::cout << count << " variants generated" << std::endl;
		if (ec)
			result = report(ec, category);
	})) {}

	else
	{
		cfg.usage(std::cerr);
		result = EXIT_FAILURE;
	}

	return result;
}

} // end of local namespace
} // end of namespace

int main(int argc, char *argv[])
{
	using namespace imagio;
	try
	{
		Configuration cfg{argc, argv, ::getenv("IMAGIO_CONFIG")};
		if (cfg.help())
		{
			cfg.usage(std::cout);
			std::cout << "\n";
			return EXIT_SUCCESS;
		}

		Log(LOG_NOTICE, "imagio (version %1%) starting", constants::version);
		return run(cfg);
	}
	catch (Exception& e)
	{
		Log(LOG_CRIT, "Uncaught boost::exception: %1%", boost::diagnostic_information(e));
		std::cerr << boost::diagnostic_information(e) << std::endl;
		return EXIT_FAILURE;
	}
	catch (std::exception& e)
	{
		Log(LOG_CRIT, "Uncaught std::exception: %1%", e.what());
		std::cerr << e.what() << std::endl;
		return EXIT_FAILURE;
	}
	catch (...)
	{
		Log(LOG_CRIT, "Uncaught unknown exception");
		return EXIT_FAILURE;
	}
}
