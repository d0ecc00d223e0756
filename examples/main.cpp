#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include "geotrax/geotrax.hpp"
#include "geotrax/json.hpp"

namespace po = boost::program_options;

namespace {

    const char *kUsage = R"(usage: geotrax [--config FILE] [--db PATH] <command> [options]

commands:
  corridor          buffer the route between two places and count listings inside
  track-corridor    same, for a GPX track file
  search            listings inside a polygon or bbox, paged
  map-points        every located listing (capped)
  bulk-geocode      geocode listings that lack a coordinate
  regeocode         re-geocode one listing, overwriting its coordinate
  import            ingest listings from a JSON array file
  areas             saved areas, newest first
  deactivate-area   soft-delete a saved area
  geocode           resolve one address
  stats             geocoding coverage

run 'geotrax <command> --help' for command options)";

    enum ExitCode { Ok = 0, Failure = 1, Invalid = 2, Missing = 3, Storage = 4 };

    void print(const nlohmann::json &j) { std::cout << j.dump(2) << std::endl; }

    po::variables_map parse(const std::vector<std::string> &args, const po::options_description &desc) {
        po::variables_map vm;
        po::store(po::command_line_parser(args).options(desc).run(), vm);
        po::notify(vm);
        return vm;
    }

    void add_filter_options(po::options_description &desc) {
        desc.add_options()("property-type", po::value<std::string>(), "category filter")(
            "offer-type", po::value<std::string>(), "offer filter (sale, rent)")(
            "min-price", po::value<double>(), "minimum price")("max-price", po::value<double>(), "maximum price");
    }

    geotrax::ListingFilters read_filters(const po::variables_map &vm) {
        geotrax::ListingFilters f;
        if (vm.count("property-type"))
            f.property_type = vm["property-type"].as<std::string>();
        if (vm.count("offer-type"))
            f.offer_type = vm["offer-type"].as<std::string>();
        if (vm.count("min-price"))
            f.min_price = vm["min-price"].as<double>();
        if (vm.count("max-price"))
            f.max_price = vm["max-price"].as<double>();
        return f;
    }

    std::string read_file(const std::string &path) {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            throw geotrax::ValidationError("cannot read file '" + path + "'");
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    int run(const std::string &command, const std::vector<std::string> &args, geotrax::SpatialService &service,
            geotrax::PointStore &store) {
        po::options_description desc(command + " options");
        desc.add_options()("help,h", "show options");

        if (command == "corridor") {
            desc.add_options()("from", po::value<std::string>()->required(), "start place or lat,lon")(
                "to", po::value<std::string>()->required(), "end place or lat,lon")(
                "buffer", po::value<int>()->default_value(5000), "buffer distance in metres")(
                "straight", "skip routing, use the straight line")("save-as", po::value<std::string>(),
                                                                     "save the corridor under this name")(
                "list", "include the matching listings");
        } else if (command == "track-corridor") {
            desc.add_options()("file", po::value<std::string>()->required(), "GPX file")(
                "buffer", po::value<int>()->default_value(5000), "buffer distance in metres")(
                "save-as", po::value<std::string>(), "save the corridor under this name")(
                "list", "include the matching listings");
        } else if (command == "search") {
            desc.add_options()("polygon", po::value<std::string>(), "POLYGON/MULTIPOLYGON text (lon lat)")(
                "min-lat", po::value<double>(), "bbox south")("min-lon", po::value<double>(), "bbox west")(
                "max-lat", po::value<double>(), "bbox north")("max-lon", po::value<double>(), "bbox east")(
                "page", po::value<int>()->default_value(1), "1-based page")(
                "page-size", po::value<int>()->default_value(50), "rows per page");
            add_filter_options(desc);
        } else if (command == "map-points") {
            add_filter_options(desc);
        } else if (command == "bulk-geocode") {
            desc.add_options()("batch", po::value<int>()->default_value(50), "listings per batch");
        } else if (command == "regeocode") {
            desc.add_options()("id", po::value<std::int64_t>()->required(), "listing id");
        } else if (command == "import") {
            desc.add_options()("file", po::value<std::string>()->required(), "JSON array of listings");
        } else if (command == "areas") {
            desc.add_options()("all", "include deactivated areas");
        } else if (command == "deactivate-area") {
            desc.add_options()("id", po::value<std::string>()->required(), "area id");
        } else if (command == "geocode") {
            desc.add_options()("address", po::value<std::string>()->required(), "address or place name");
        } else if (command != "stats") {
            std::cerr << "Error: unknown command '" << command << "'\n" << kUsage << std::endl;
            return Invalid;
        }

        // --help must work without the required options
        for (const auto &arg : args) {
            if (arg == "--help" || arg == "-h") {
                std::cout << desc << std::endl;
                return Ok;
            }
        }
        auto vm = parse(args, desc);

        if (command == "corridor") {
            geotrax::CorridorRequest req;
            req.start = vm["from"].as<std::string>();
            req.end = vm["to"].as<std::string>();
            req.buffer_meters = vm["buffer"].as<int>();
            req.use_route = !vm.count("straight");
            if (vm.count("save-as"))
                req.save_as = vm["save-as"].as<std::string>();
            req.list_matches = vm.count("list") > 0;
            print(service.build_corridor(req));
        } else if (command == "track-corridor") {
            geotrax::TrackCorridorRequest req;
            req.track_bytes = read_file(vm["file"].as<std::string>());
            req.buffer_meters = vm["buffer"].as<int>();
            if (vm.count("save-as"))
                req.save_as = vm["save-as"].as<std::string>();
            req.list_matches = vm.count("list") > 0;
            print(service.build_corridor_from_track(req));
        } else if (command == "search") {
            geotrax::SearchRequest req;
            if (vm.count("polygon"))
                req.polygon_wkt = vm["polygon"].as<std::string>();
            if (vm.count("min-lat"))
                req.min_lat = vm["min-lat"].as<double>();
            if (vm.count("min-lon"))
                req.min_lon = vm["min-lon"].as<double>();
            if (vm.count("max-lat"))
                req.max_lat = vm["max-lat"].as<double>();
            if (vm.count("max-lon"))
                req.max_lon = vm["max-lon"].as<double>();
            req.filters = read_filters(vm);
            req.page = vm["page"].as<int>();
            req.page_size = vm["page-size"].as<int>();
            print(service.search(req));
        } else if (command == "map-points") {
            print(service.map_points(read_filters(vm)));
        } else if (command == "bulk-geocode") {
            print(service.bulk_geocode(vm["batch"].as<int>()));
        } else if (command == "regeocode") {
            const bool found = service.regeocode(vm["id"].as<std::int64_t>());
            print(nlohmann::json{{"id", vm["id"].as<std::int64_t>()}, {"geocoded", found}});
        } else if (command == "import") {
            auto doc = nlohmann::json::parse(read_file(vm["file"].as<std::string>()));
            if (!doc.is_array())
                throw geotrax::ValidationError("import file must hold a JSON array of listings");
            std::vector<std::int64_t> ids;
            for (const auto &item : doc)
                ids.push_back(store.insert_listing(geotrax::listing_from_json(item)));
            print(nlohmann::json{{"imported", ids.size()}, {"ids", ids}});
        } else if (command == "areas") {
            print(vm.count("all") ? service.areas().list_areas(false) : service.list_areas());
        } else if (command == "deactivate-area") {
            const auto id = vm["id"].as<std::string>();
            print(nlohmann::json{{"id", id}, {"deactivated", service.deactivate_area(id)}});
        } else if (command == "geocode") {
            print(service.geocode(vm["address"].as<std::string>()));
        } else {
            print(service.geocode_stats());
        }
        return Ok;
    }

} // namespace

int main(int argc, char **argv) {
    po::options_description global("geotrax options");
    global.add_options()("help,h", "show usage")("config,c", po::value<std::string>(), "JSON config file")(
        "db", po::value<std::string>(), "SQLite database path (overrides config)")(
        "command", po::value<std::string>(), "command")("args", po::value<std::vector<std::string>>(), "arguments");

    po::positional_options_description pos;
    pos.add("command", 1).add("args", -1);

    try {
        po::parsed_options parsed =
            po::command_line_parser(argc, argv).options(global).positional(pos).allow_unregistered().run();
        po::variables_map vm;
        po::store(parsed, vm);
        po::notify(vm);

        if (!vm.count("command")) {
            std::cout << kUsage << "\n\n" << global << std::endl;
            return vm.count("help") ? Ok : Invalid;
        }

        const std::string command = vm["command"].as<std::string>();
        std::vector<std::string> args = po::collect_unrecognized(parsed.options, po::include_positional);
        args.erase(args.begin()); // the command itself
        if (vm.count("help"))
            args.push_back("--help");

        geotrax::Config config = vm.count("config") ? geotrax::load_config(vm["config"].as<std::string>())
                                                    : geotrax::Config{};
        if (vm.count("db"))
            config.store.path = vm["db"].as<std::string>();

        auto http = std::make_shared<geotrax::CurlHttpClient>();
        geotrax::PointStore store(config.store);
        geotrax::SpatialService service(config, store,
                                        std::make_shared<geotrax::NominatimProvider>(config.geocoder, http),
                                        std::make_shared<geotrax::OsrmProvider>(config.router, http));

        return run(command, args, service, store);
    } catch (const po::error &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return Invalid;
    } catch (const geotrax::ValidationError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return Invalid;
    } catch (const geotrax::NotFound &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return Missing;
    } catch (const geotrax::PersistenceError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return Storage;
    } catch (const nlohmann::json::exception &e) {
        std::cerr << "Error: malformed JSON: " << e.what() << std::endl;
        return Invalid;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return Failure;
    }
}
