#include <gtest/gtest.h>
#include "../../src/common/configuration.h"
#include "../../src/common/errors.h"
#include "../../src/database/pbs_orchestrator.h"

#include <algorithm>

using namespace Mosaic;

class PBSOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Configuration::getInstance().reset();
    }

    static OrchestratorOptions Options(int db_nodes, const std::string& run_command, bool batch) {
        OrchestratorOptions options;
        options.db_nodes = db_nodes;
        options.run_command = run_command;
        options.batch = batch;
        options.path = "/scratch/db";
        return options;
    }

    static bool Contains(const std::vector<std::string>& args, const std::string& value) {
        return std::find(args.begin(), args.end(), value) != args.end();
    }
};

TEST_F(PBSOrchestratorTest, TwoNodesRejectedForEveryLauncher) {
    for (const std::string run_command : {"aprun", "mpirun"}) {
        for (bool batch : {true, false}) {
            OrchestratorOptions options = Options(2, run_command, batch);
            options.hosts = {"nid1", "nid2"};
            EXPECT_THROW(PBSOrchestrator{options}, TopologyConstraintError)
                << run_command << (batch ? " batch" : " interactive");
        }
    }
}

TEST_F(PBSOrchestratorTest, SingleNodeLaunchLine) {
    PBSOrchestrator orc(Options(1, "aprun", false));

    EXPECT_FALSE(orc.IsClustered());
    EXPECT_FALSE(orc.batch());
    EXPECT_EQ(orc.batch_settings(), nullptr);
    ASSERT_EQ(orc.size(), 1u);
    EXPECT_EQ(orc.Ports(), (std::vector<int>{6379}));

    const DBNode& node = *orc.Nodes()[0];
    EXPECT_EQ(node.name(), "orchestrator_0");
    EXPECT_EQ(node.path(), "/scratch/db");
    EXPECT_EQ(node.run_settings().Format(), (std::vector<std::string>{
        "aprun", "--pes=1", "--pes-per-node=1",
        "redis-server", "redis.conf",
        "--loadmodule", "redisai.so",
        "--loadmodule", "libredisip.so",
        "--port", "6379"}));
}

TEST_F(PBSOrchestratorTest, ThreeNodesRunClustered) {
    OrchestratorOptions options = Options(3, "aprun", false);
    options.port = 6780;
    PBSOrchestrator orc(options);

    EXPECT_TRUE(orc.IsClustered());
    ASSERT_EQ(orc.size(), 3u);
    for (size_t i = 0; i < orc.size(); ++i) {
        const auto& args = orc.Nodes()[i]->run_settings().exe_args();
        const std::string node_name = "orchestrator_" + std::to_string(i);
        EXPECT_EQ(orc.Nodes()[i]->name(), node_name);
        EXPECT_TRUE(Contains(args, "--cluster-enabled"));
        EXPECT_TRUE(Contains(args, "nodes-" + node_name + "-6780.conf"));
        EXPECT_TRUE(Contains(args, "6780"));
    }
}

TEST_F(PBSOrchestratorTest, InvalidNodeCountAndPort) {
    EXPECT_THROW(PBSOrchestrator{Options(0, "aprun", false)}, ConfigurationError);
    OrchestratorOptions options = Options(1, "aprun", false);
    options.port = 70000;
    EXPECT_THROW(PBSOrchestrator{options}, ConfigurationError);
}

TEST_F(PBSOrchestratorTest, UnknownRunCommand) {
    EXPECT_THROW(PBSOrchestrator{Options(1, "srun", false)}, UnsupportedCapabilityError);
}

TEST_F(PBSOrchestratorTest, MpirunRequiresHosts) {
    EXPECT_THROW(PBSOrchestrator{Options(1, "mpirun", false)}, TopologyConstraintError);
    EXPECT_THROW(PBSOrchestrator{Options(3, "mpirun", true)}, TopologyConstraintError);
}

TEST_F(PBSOrchestratorTest, MpirunPlacesEachNode) {
    OrchestratorOptions options = Options(3, "mpirun", true);
    options.hosts = {"nid1", "nid2", "nid3"};
    PBSOrchestrator orc(options);

    for (size_t i = 0; i < orc.size(); ++i) {
        const DBNode& node = *orc.Nodes()[i];
        const std::string host = "nid" + std::to_string(i + 1);
        EXPECT_EQ(node.GetHost(), host);
        EXPECT_EQ(node.run_settings().run_args().at("host"), std::optional<std::string>(host));
    }
    EXPECT_EQ(orc.qsub_settings()->hosts(), options.hosts);
}

TEST_F(PBSOrchestratorTest, AprunInBatchLeavesPlacementToScheduler) {
    OrchestratorOptions options = Options(3, "aprun", true);
    PBSOrchestrator orc(options);
    orc.SetHosts({"nid1", "nid2", "nid3"});

    for (const auto& node : orc) {
        EXPECT_TRUE(node->host().has_value());
        EXPECT_EQ(node->run_settings().run_args().count("node-list"), 0u);
    }
    EXPECT_EQ(orc.qsub_settings()->hosts().size(), 3u);
    EXPECT_EQ(orc.GetAddresses(), (std::vector<std::string>{"nid1:6379", "nid2:6379", "nid3:6379"}));
}

TEST_F(PBSOrchestratorTest, AprunInteractiveSetsNodeList) {
    PBSOrchestrator orc(Options(1, "aprun", false));
    orc.SetHost("  nid00007 \n");

    const DBNode& node = *orc.Nodes()[0];
    EXPECT_EQ(node.GetHost(), "nid00007");
    EXPECT_EQ(node.run_settings().run_args().at("node-list"), std::optional<std::string>("nid00007"));
}

TEST_F(PBSOrchestratorTest, FewerHostsThanNodes) {
    PBSOrchestrator orc(Options(3, "aprun", false));
    orc.SetHosts(std::vector<std::string>{"nid1"});

    EXPECT_EQ(orc.Nodes()[0]->GetHost(), "nid1");
    EXPECT_FALSE(orc.Nodes()[1]->host().has_value());
    EXPECT_THROW(orc.GetAddresses(), ConfigurationError);
}

TEST_F(PBSOrchestratorTest, InvalidHostValues) {
    PBSOrchestrator orc(Options(1, "aprun", false));
    EXPECT_THROW(orc.SetHosts(std::vector<std::string>{"nid1", ""}), TypeError);
    EXPECT_THROW(orc.SetHostsFromYaml(YAML::Load("{host: nid1}")), TypeError);
    EXPECT_THROW(orc.SetHostsFromYaml(YAML::Load("[nid1, [nid2]]")), TypeError);
    EXPECT_FALSE(orc.Nodes()[0]->host().has_value());
}

TEST_F(PBSOrchestratorTest, EmptyHostListPlacesNothing) {
    PBSOrchestrator orc(Options(3, "aprun", true));
    orc.SetHosts({});
    orc.SetHostsFromYaml(YAML::Load("[]"));

    for (const auto& node : orc) {
        EXPECT_FALSE(node->host().has_value());
    }
    EXPECT_TRUE(orc.qsub_settings()->hosts().empty());
}

TEST_F(PBSOrchestratorTest, HostsFromYamlScalarOrList) {
    PBSOrchestrator single(Options(1, "aprun", false));
    single.SetHostsFromYaml(YAML::Load("nid5"));
    EXPECT_EQ(single.Nodes()[0]->GetHost(), "nid5");

    PBSOrchestrator cluster(Options(3, "aprun", false));
    cluster.SetHostsFromYaml(YAML::Load("[nid1, nid2, nid3]"));
    EXPECT_EQ(cluster.GetAddresses(), (std::vector<std::string>{"nid1:6379", "nid2:6379", "nid3:6379"}));
}

TEST_F(PBSOrchestratorTest, BracedHostLists) {
    PBSOrchestrator orc(Options(3, "aprun", false));
    orc.SetHosts({"nid1", "nid2"});
    EXPECT_EQ(orc.Nodes()[1]->GetHost(), "nid2");

    orc.SetHosts({"nid7"});
    EXPECT_EQ(orc.Nodes()[0]->GetHost(), "nid7");
}

TEST_F(PBSOrchestratorTest, SetCpusInBatchRaisesJobRequest) {
    PBSOrchestrator orc(Options(3, "aprun", true));
    orc.SetCpus(8);

    EXPECT_EQ(orc.qsub_settings()->ncpus(), 8);
    for (const auto& node : orc) {
        EXPECT_EQ(node->run_settings().run_args().at("cpus-per-pe"), std::optional<std::string>("8"));
    }
}

TEST_F(PBSOrchestratorTest, BatchOnlyMutators) {
    PBSOrchestrator interactive(Options(1, "aprun", false));
    EXPECT_THROW(interactive.SetWalltime("01:00:00"), ConfigurationError);
    EXPECT_THROW(interactive.SetBatchArg("V"), ConfigurationError);

    OrchestratorOptions options = Options(1, "aprun", true);
    options.queue = "debug";
    PBSOrchestrator batch(options);
    batch.SetWalltime("01:00:00");
    batch.SetBatchArg("A", std::string("proj"));

    const auto lines = batch.batch_settings()->FormatBatchArgs();
    EXPECT_TRUE(Contains(lines, "#PBS -l select=1:ncpus=1"));
    EXPECT_TRUE(Contains(lines, "#PBS -l walltime=01:00:00"));
    EXPECT_TRUE(Contains(lines, "#PBS -q debug"));
    EXPECT_TRUE(Contains(lines, "#PBS -A proj"));
}

TEST_F(PBSOrchestratorTest, DefaultsComeFromConfiguration) {
    Configuration::getInstance().config().database.port.set(7000);
    Configuration::getInstance().config().launcher.batch.set(false);

    OrchestratorOptions options;
    PBSOrchestrator orc(options);
    EXPECT_EQ(orc.port(), 7000);
    EXPECT_FALSE(orc.batch());
    EXPECT_EQ(orc.run_command(), RunCommand::APRUN);
}

TEST_F(PBSOrchestratorTest, ModuleThreadingArgs) {
    OrchestratorOptions options = Options(1, "aprun", false);
    options.threads_per_queue = 2;
    options.intra_op_threads = 4;
    PBSOrchestrator orc(options);

    const auto& args = orc.Nodes()[0]->run_settings().exe_args();
    EXPECT_TRUE(Contains(args, "THREADS_PER_QUEUE"));
    EXPECT_TRUE(Contains(args, "INTRA_OP_PARALLELISM"));
    EXPECT_FALSE(Contains(args, "INTER_OP_PARALLELISM"));
}

TEST_F(PBSOrchestratorTest, SetPathPropagatesToNodes) {
    PBSOrchestrator orc(Options(3, "aprun", false));
    orc.SetPath("/other");
    for (const auto& node : orc) {
        EXPECT_EQ(node->path(), "/other");
    }
}
