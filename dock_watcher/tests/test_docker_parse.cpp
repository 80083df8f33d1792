#include "docker_cli.hpp"
#include "docker_parse.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace DockWatch;

namespace {

    bool has_pair(const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
        for (size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == flag && args[i + 1] == value) return true;
        }
        return false;
    }

}

// --- Sizes ---

TEST(DockerParse, SizesUnderstandBothUnitFamilies) {
    EXPECT_EQ(parse_size("0B"), 0u);
    EXPECT_EQ(parse_size("12kB"), 12000u);
    EXPECT_EQ(parse_size("1.5MiB"), 1572864u);
    EXPECT_EQ(parse_size("2GB"), 2000000000u);
    EXPECT_EQ(parse_size(" 1KiB "), 1024u);
    EXPECT_EQ(parse_size("--"), 0u);
    EXPECT_DOUBLE_EQ(parse_percent("12.50%"), 12.5);
    EXPECT_DOUBLE_EQ(parse_percent("--"), 0.0);
}

TEST(DockerParse, PortsAreDeduplicatedAcrossAddressFamilies) {
    auto ports = parse_ports("0.0.0.0:8080->80/tcp, :::8080->80/tcp, 443/tcp");
    ASSERT_EQ(ports.size(), 2u);
    EXPECT_EQ(ports[0].public_port, 8080);
    EXPECT_EQ(ports[0].private_port, 80);
    EXPECT_EQ(ports[0].ip, "0.0.0.0");
    EXPECT_EQ(ports[1].public_port, 0);
    EXPECT_EQ(ports[1].private_port, 443);
    EXPECT_EQ(ports[1].type, "tcp");
}

// --- Listings ---

TEST(DockerParse, ContainerLine) {
    auto c = parse_container_line(
        R"({"ID":"0123456789abcdef","Names":"web","Image":"nginx:1.25","Status":"Up 3 hours","State":"running",)"
        R"("CreatedAt":"2024-01-01 10:00:00 +0000 UTC","Ports":"0.0.0.0:8080->80/tcp","Networks":"frontend,backend",)"
        R"("Labels":"com.docker.compose.project=shop,com.docker.compose.service=web","Mounts":"data,/srv/www"})");

    EXPECT_EQ(c.id, "0123456789abcdef");
    EXPECT_EQ(c.short_id(), "0123456789ab");
    EXPECT_EQ(c.name, "web");
    EXPECT_TRUE(c.is_running());
    EXPECT_EQ(c.networks, (std::vector<std::string>{"frontend", "backend"}));
    EXPECT_EQ(c.labels.at("com.docker.compose.project"), "shop");
    ASSERT_EQ(c.mounts.size(), 2u);
    EXPECT_EQ(c.mounts[0].type, "volume");
    EXPECT_EQ(c.mounts[0].name, "data");
    EXPECT_EQ(c.mounts[1].type, "bind");
    EXPECT_EQ(c.ports_string(), "8080:80/tcp");
}

TEST(DockerParse, ContainerLineWithoutIdIsRejected) {
    EXPECT_THROW(parse_container_line(R"({"Names":"web"})"), ClientError);
    EXPECT_THROW(parse_container_line("not json"), ClientError);
}

TEST(DockerParse, ImageLinesMergeTagsById) {
    auto images = parse_image_lines(
        R"({"ID":"sha256:aaa","Repository":"nginx","Tag":"latest","Size":"187MB","CreatedAt":"2024-01-01"})"
        "\n"
        R"({"ID":"sha256:aaa","Repository":"nginx","Tag":"1.25","Size":"187MB","CreatedAt":"2024-01-01"})"
        "\n"
        R"({"ID":"sha256:bbb","Repository":"<none>","Tag":"<none>","Size":"5MB","CreatedAt":"2023-01-01"})"
        "\n");
    ASSERT_EQ(images.size(), 2u);
    EXPECT_EQ(images[0].repo_tags, (std::vector<std::string>{"nginx:latest", "nginx:1.25"}));
    EXPECT_EQ(images[0].size, 187000000);
    EXPECT_TRUE(images[1].repo_tags.empty());
}

TEST(DockerParse, NetworkInspect) {
    auto networks = parse_network_inspect(R"([
        {"Name":"bridge","Id":"n1","Driver":"bridge","Scope":"local","Internal":false,
         "IPAM":{"Config":[{"Subnet":"172.17.0.0/16","Gateway":"172.17.0.1"}]},
         "Containers":{"c1":{"Name":"web"},"c2":{"Name":"db"}}},
        {"Name":"backend","Id":"n2","Driver":"bridge","Scope":"local","Internal":true,
         "IPAM":{"Config":[]},"Containers":{}}
    ])");
    ASSERT_EQ(networks.size(), 2u);
    EXPECT_EQ(networks[0].subnet, "172.17.0.0/16");
    EXPECT_EQ(networks[0].containers, (std::vector<std::string>{"c1", "c2"}));
    EXPECT_TRUE(networks[0].is_system());
    EXPECT_TRUE(networks[1].internal);
    EXPECT_FALSE(networks[1].is_system());
    EXPECT_TRUE(networks[1].containers.empty());
}

TEST(DockerParse, ComposeProjectsFromLabels) {
    Container a;
    a.id = "a";
    a.state = "running";
    a.labels = {{"com.docker.compose.project", "shop"}, {"com.docker.compose.service", "web"},
                {"com.docker.compose.project.working_dir", "/srv/shop"}};
    Container b = a;
    b.id = "b";
    b.state = "exited";
    Container c = a;
    c.id = "c";
    c.labels["com.docker.compose.service"] = "db";
    Container loose;
    loose.id = "d";

    auto projects = build_compose_projects({a, b, c, loose});
    ASSERT_EQ(projects.size(), 1u);
    const auto& p = projects[0];
    EXPECT_EQ(p.name, "shop");
    EXPECT_EQ(p.working_dir, "/srv/shop");
    EXPECT_EQ(p.container_ids.size(), 3u);
    ASSERT_EQ(p.services.size(), 2u);
    EXPECT_EQ(p.services[0].name, "web");
    EXPECT_EQ(p.services[0].containers.size(), 2u);
    EXPECT_EQ(p.running_count(), 2);
    EXPECT_FALSE(p.all_running());
}

// --- Inspect ---

TEST(DockerParse, InspectConfig) {
    auto cfg = parse_inspect_config(R"([{
        "Name":"/web",
        "Config":{"Image":"nginx:1.25","Env":["A=1","PATH=/usr/bin"],"Cmd":["nginx","-g","daemon off;"],
                  "Entrypoint":null,"WorkingDir":"/app","User":"",
                  "Labels":{"com.example.role":"frontend"}},
        "HostConfig":{"Binds":["/srv/www:/usr/share/nginx/html:ro"],"NetworkMode":"frontend","Privileged":false,
                      "RestartPolicy":{"Name":"on-failure","MaximumRetryCount":3},
                      "PortBindings":{"80/tcp":[{"HostIp":"","HostPort":"8080"}]},"CapAdd":null,"CapDrop":null},
        "NetworkSettings":{"Networks":{"frontend":{"NetworkID":"n1","IPAddress":"172.18.0.2","Aliases":["web"]},
                                       "backend":{"NetworkID":"n2","IPAddress":"172.19.0.2","Aliases":null}}}
    }])");

    EXPECT_EQ(cfg.name, "web");
    EXPECT_EQ(cfg.image, "nginx:1.25");
    EXPECT_EQ(cfg.env, (std::vector<std::string>{"A=1", "PATH=/usr/bin"}));
    EXPECT_EQ(cfg.cmd.size(), 3u);
    EXPECT_TRUE(cfg.entrypoint.empty());
    EXPECT_EQ(cfg.labels.at("com.example.role"), "frontend");
    EXPECT_EQ(cfg.restart_policy.name, "on-failure");
    EXPECT_EQ(cfg.restart_policy.maximum_retry_count, 3);
    ASSERT_EQ(cfg.port_bindings.at("80/tcp").size(), 1u);
    EXPECT_EQ(cfg.port_bindings.at("80/tcp")[0].host_port, "8080");
    ASSERT_EQ(cfg.networks.size(), 2u);
    EXPECT_EQ(cfg.networks.at("frontend").aliases, (std::vector<std::string>{"web"}));
    EXPECT_TRUE(cfg.networks.at("backend").aliases.empty());
}

TEST(DockerParse, CreateArgsRebuildTheContainer) {
    ContainerFullConfig cfg;
    cfg.name = "web";
    cfg.image = "nginx:1.25";
    cfg.env = {"A=1"};
    cfg.entrypoint = {"/docker-entrypoint.sh", "--verbose"};
    cfg.cmd = {"nginx"};
    cfg.restart_policy = {"on-failure", 3};
    cfg.port_bindings["80/tcp"] = {{"", "8080"}, {"127.0.0.1", "9090"}};
    cfg.networks["frontend"] = NetworkEndpoint{"n1", "", {"web"}};
    cfg.networks["backend"] = NetworkEndpoint{"n2", "", {}};

    auto args = DockerCliClient::create_args(cfg, "frontend");
    EXPECT_EQ(args.front(), "create");
    EXPECT_TRUE(has_pair(args, "--name", "web"));
    EXPECT_TRUE(has_pair(args, "--env", "A=1"));
    EXPECT_TRUE(has_pair(args, "--restart", "on-failure:3"));
    EXPECT_TRUE(has_pair(args, "--publish", "8080:80/tcp"));
    EXPECT_TRUE(has_pair(args, "--publish", "127.0.0.1:9090:80/tcp"));
    EXPECT_TRUE(has_pair(args, "--network", "frontend"));
    EXPECT_TRUE(has_pair(args, "--network-alias", "web"));
    EXPECT_FALSE(has_pair(args, "--network", "backend"));
    EXPECT_TRUE(has_pair(args, "--entrypoint", "/docker-entrypoint.sh"));

    // image, then the rest of the entrypoint, then the command
    auto image = std::find(args.begin(), args.end(), "nginx:1.25");
    ASSERT_NE(image, args.end());
    EXPECT_EQ(std::vector<std::string>(image + 1, args.end()), (std::vector<std::string>{"--verbose", "nginx"}));
}

TEST(DockerParse, CreateArgsOnBuiltinNetworkSkipsAliases) {
    ContainerFullConfig cfg;
    cfg.image = "redis";
    cfg.networks["bridge"] = NetworkEndpoint{"n0", "", {"cache"}};

    auto args = DockerCliClient::create_args(cfg, "bridge");
    EXPECT_TRUE(has_pair(args, "--network", "bridge"));
    EXPECT_EQ(std::find(args.begin(), args.end(), "--network-alias"), args.end());
    EXPECT_EQ(args.back(), "redis");
}

// --- Streams ---

TEST(DockerParse, StatsLineSkipsControlCodes) {
    auto s = parse_stats_line("\x1b[2J\x1b[H"
                              R"({"ID":"abc","CPUPerc":"3.25%","MemPerc":"10.00%","MemUsage":"100MiB / 1GiB",)"
                              R"("NetIO":"1.2kB / 800B","BlockIO":"4MB / 0B","PIDs":"7"})");
    ASSERT_TRUE(s);
    EXPECT_EQ(s->container_id, "abc");
    EXPECT_DOUBLE_EQ(s->cpu_percent, 3.25);
    EXPECT_EQ(s->memory_usage, 104857600u);
    EXPECT_EQ(s->memory_limit, 1073741824u);
    EXPECT_EQ(s->network_rx, 1200u);
    EXPECT_EQ(s->network_tx, 800u);
    EXPECT_EQ(s->block_read, 4000000u);
    EXPECT_EQ(s->pids, 7u);

    EXPECT_FALSE(parse_stats_line("\x1b[2J"));
}

TEST(DockerParse, LogLineTimestamp) {
    auto e = parse_log_line("2024-03-01T12:30:45.123456789Z GET /index.html 200");
    EXPECT_EQ(e.line, "GET /index.html 200");
    EXPECT_EQ(std::chrono::system_clock::to_time_t(e.timestamp), 1709296245);

    auto plain = parse_log_line("no timestamp here");
    EXPECT_EQ(plain.line, "no timestamp here");
}

// --- Prune ---

TEST(DockerParse, PruneOutput) {
    auto report = parse_prune_output("Deleted Images:\n"
                                     "untagged: nginx@sha256:abc\n"
                                     "deleted: sha256:111\n"
                                     "deleted: sha256:222\n"
                                     "\n"
                                     "Total reclaimed space: 1.5MB\n");
    EXPECT_EQ(report.removed, 2);
    EXPECT_EQ(report.space_reclaimed, 1500000u);

    auto none = parse_prune_output("Total reclaimed space: 0B\n");
    EXPECT_EQ(none.removed, 0);
}
