#include "bench_utils.hpp"

#include <lshpp/index.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace std;
namespace fs = filesystem;

struct Config {
    fs::path data_dir = "data/sift";
    string family = "srp";
    int n_hash_tables = 16;
    int n_projections = 4;
    float r = 4.0f;
    float U = 0.83f;
    int m = 3;
    uint64_t seed = 0;
    int n_queries = 100;
    string db_path = "";
};

void print_usage(const char* program_name) {
    cout << "Usage: " << program_name << " [options]\n"
         << "Options:\n"
         << "  -d, --data-dir        Data directory (default: data/sift)\n"
         << "  -f, --family          Hash family: srp, l2 or mips (default: srp)\n"
         << "  -h, --n-hash-tables   Number of hash tables (default: 16)\n"
         << "  -p, --n-projections   Number of projections per table (default: 4)\n"
         << "  -r, --r               Quantization width for l2 and mips (default: 4.0)\n"
         << "  -u, --U               MIPS norm bound in (0, 1) (default: 0.83)\n"
         << "  -m, --m               MIPS norm terms (default: 3)\n"
         << "  -s, --seed            Random seed (default: random)\n"
         << "  -q, --num-queries     Number of test queries (default: 100)\n"
         << "  -b, --db-path         Store the index in this SQLite file (default: in memory)\n";
}

Config parse_args(int argc, char* argv[]) {
    Config conf;

    static struct option long_options[] = {
        {"data-dir", required_argument, 0, 'd'},      {"family", required_argument, 0, 'f'},
        {"n-hash-tables", required_argument, 0, 'h'}, {"n-projections", required_argument, 0, 'p'},
        {"r", required_argument, 0, 'r'},             {"U", required_argument, 0, 'u'},
        {"m", required_argument, 0, 'm'},             {"seed", required_argument, 0, 's'},
        {"num-queries", required_argument, 0, 'q'},   {"db-path", required_argument, 0, 'b'},
        {0, 0, 0, 0},
    };

    int c;
    while ((c = getopt_long(argc, argv, "d:f:h:p:r:u:m:s:q:b:", long_options, nullptr)) != -1) {
        switch (c) {
        case 'd':
            conf.data_dir = optarg;
            break;
        case 'f':
            conf.family = optarg;
            break;
        case 'h':
            conf.n_hash_tables = atoi(optarg);
            break;
        case 'p':
            conf.n_projections = atoi(optarg);
            break;
        case 'r':
            conf.r = strtof(optarg, nullptr);
            break;
        case 'u':
            conf.U = strtof(optarg, nullptr);
            break;
        case 'm':
            conf.m = atoi(optarg);
            break;
        case 's':
            conf.seed = strtoull(optarg, nullptr, 10);
            break;
        case 'q':
            conf.n_queries = atoi(optarg);
            break;
        case 'b':
            conf.db_path = optarg;
            break;
        default:
            print_usage(argv[0]);
            exit(1);
        }
    }

    if (conf.family != "srp" && conf.family != "l2" && conf.family != "mips") {
        print_usage(argv[0]);
        exit(1);
    }

    return conf;
}

lshpp::Index make_index(const Config& conf, int dim, const vector<lshpp::DataPoint>& X) {
    if (conf.family == "l2") {
        return lshpp::Index::l2(conf.n_projections, conf.n_hash_tables, dim, conf.r, conf.seed,
                                conf.db_path);
    }
    if (conf.family == "mips") {
        return lshpp::Index::mips(conf.n_projections, conf.n_hash_tables, dim, conf.r, conf.U,
                                  conf.m, conf.seed, X, conf.db_path);
    }
    return lshpp::Index::srp(conf.n_projections, conf.n_hash_tables, dim, conf.seed,
                             conf.db_path);
}

int main(int argc, char* argv[]) {
    Config conf = parse_args(argc, argv);

    if (!fs::exists(conf.data_dir) || !fs::is_directory(conf.data_dir)) {
        throw runtime_error("Directory '" + conf.data_dir.string() + "' not found");
    }

    vector<lshpp::DataPoint> X = bench::read_fvecs(conf.data_dir / "sift_base.fvecs");
    vector<lshpp::DataPoint> Q = bench::read_fvecs(conf.data_dir / "sift_query.fvecs");
    if (X.empty() || Q.empty()) {
        throw runtime_error("Empty base or query set in '" + conf.data_dir.string() + "'");
    }
    int dim = static_cast<int>(X[0].size());

    cout << "Data shape: " << X.size() << "x" << dim << endl;
    cout << "Query shape: " << Q.size() << "x" << Q[0].size() << endl;

    conf.n_queries = min(conf.n_queries, static_cast<int>(Q.size()));
    vector<lshpp::DataPoint> Q_test(Q.begin(), Q.begin() + conf.n_queries);
    cout << "Using " << conf.n_queries << " test queries" << endl;

    // create index
    lshpp::Index index = make_index(conf, dim, X);

    cout << "\nCreated LSH index:" << endl;
    cout << "  family: " << index.family() << endl;
    cout << "  n_hash_tables: " << conf.n_hash_tables << endl;
    cout << "  n_projections: " << conf.n_projections << endl;
    cout << "  seed: " << conf.seed << endl;
    cout << "  storage: " << (conf.db_path.empty() ? "memory" : conf.db_path) << endl;
    cout << endl;

    // store
    cout << "Running store_vecs()..." << endl;
    auto start_time = chrono::high_resolution_clock::now();
    index.store_vecs(X);
    auto store_time = chrono::high_resolution_clock::now() - start_time;
    auto store_seconds = chrono::duration_cast<chrono::duration<double>>(store_time).count();
    cout << "store_vecs() completed in " << store_seconds << "s" << endl << endl;

    // query
    cout << "Running query_bucket_idx()..." << endl;
    vector<vector<lshpp::PointIndex>> all_candidates;
    all_candidates.reserve(Q_test.size());
    start_time = chrono::high_resolution_clock::now();
    for (const lshpp::DataPoint& q : Q_test) {
        all_candidates.push_back(index.query_bucket_idx(q));
    }
    auto query_time = chrono::high_resolution_clock::now() - start_time;
    auto query_seconds = chrono::duration_cast<chrono::duration<double>>(query_time).count();
    cout << "query_bucket_idx() completed in " << query_seconds << "s" << endl;

    bench::Metric metric = bench::metric_for_family(conf.family);
    bench::RecallResults recall = bench::evaluate_recall(Q_test, X, all_candidates, metric);

    // save report
    if (!fs::create_directories("results") && !fs::exists("results")) {
        throw runtime_error("Failed to create results directory");
    }
    auto now = chrono::system_clock::now();
    auto time_t = chrono::system_clock::to_time_t(now);
    stringstream ss;
    ss << put_time(localtime(&time_t), "%Y%m%d_%H%M%S");
    string report_path = "results/report_" + conf.family + "_h" + to_string(conf.n_hash_tables) +
                         "_p" + to_string(conf.n_projections) + "_" + ss.str() + ".json";

    ofstream report(report_path);
    report << "{\n";
    report << "    \"params\": {\n";
    report << "        \"family\": \"" << conf.family << "\",\n";
    report << "        \"n_hash_tables\": " << conf.n_hash_tables << ",\n";
    report << "        \"n_projections\": " << conf.n_projections << ",\n";
    report << "        \"r\": " << conf.r << ",\n";
    report << "        \"U\": " << conf.U << ",\n";
    report << "        \"m\": " << conf.m << ",\n";
    report << "        \"seed\": " << conf.seed << ",\n";
    report << "        \"storage\": \"" << (conf.db_path.empty() ? "memory" : "sqlite") << "\",\n";
    report << "        \"num_queries\": " << conf.n_queries << "\n";
    report << "    },\n";
    report << "    \"runtimes\": {\n";
    report << "        \"store_time\": " << store_seconds << ",\n";
    report << "        \"query_time\": " << query_seconds << "\n";
    report << "    },\n";
    report << "    \"recall\": {\n";
    report << "        \"metric\": \"" << bench::metric_name(metric) << "\",\n";
    report << "        \"avg_recall\": " << recall.avg_recall << ",\n";
    report << "        \"avg_candidates\": " << recall.avg_candidates << ",\n";
    report << "        \"queries_with_candidates\": " << recall.queries_with_candidates << "\n";
    report << "    }\n";
    report << "}\n";
    report.close();

    cout << "Report saved to " << report_path << endl;
}
