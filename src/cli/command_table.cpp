#include "cli/command_table.hpp"
#include "cli/network_commands.hpp"

const char* const kRootCommand = "network";
const char* const kRootShortHelp = "work with vcd networks";

static const char* const kExternalHelp =
    "Work with external networks.\n"
    "\n"
    "Note\n"
    "    Only system administrators can work with external networks.\n"
    "\n"
    "Examples\n"
    "    vcdnet network external create external-net1 vc1 \\\n"
    "            --port-group pg1 --port-group pg2 \\\n"
    "            --gateway 192.168.1.1 --netmask 255.255.255.0 \\\n"
    "            --ip-range 192.168.1.2-192.168.1.49 \\\n"
    "            --ip-range 192.168.1.100-192.168.1.149 \\\n"
    "            --description 'External network' \\\n"
    "            --dns1 8.8.8.8 --dns2 8.8.8.9 --dns-suffix example.com\n"
    "        Create an external network. --port-group and --ip-range are\n"
    "        required and may both be repeated.\n"
    "\n"
    "    vcdnet network external list\n"
    "        List all external networks in the system.\n"
    "\n"
    "    vcdnet network external delete external-net1\n"
    "        Delete an external network.\n"
    "\n"
    "    vcdnet network external update external-net1 \\\n"
    "            --name new-external-net1 --description 'New external network'\n"
    "        Update name and description of an external network.\n";

static const char* const kDirectHelp =
    "Work with directly connected org vdc networks.\n"
    "\n"
    "Note\n"
    "    System administrators have full control on direct org vdc networks.\n"
    "    Organization administrators can only list them.\n"
    "\n"
    "Examples\n"
    "    vcdnet network direct create direct-net1 --parent ext-net1 \\\n"
    "            --description 'Directly connected VDC network'\n"
    "        Create an org vdc network directly connected to an external\n"
    "        network.\n"
    "\n"
    "    vcdnet network direct list\n"
    "        List all directly connected org vdc networks in the selected vdc.\n"
    "\n"
    "    vcdnet network direct delete direct-net1\n"
    "        Delete direct network 'direct-net1' in the selected vdc.\n";

static const char* const kIsolatedHelp =
    "Work with isolated org vdc networks.\n"
    "\n"
    "Note\n"
    "    Both system administrators and organization administrators can\n"
    "    create, delete or list isolated org vdc networks.\n"
    "\n"
    "Examples\n"
    "    vcdnet network isolated create isolated-net1 --gateway 192.168.1.1 \\\n"
    "            --netmask 255.255.255.0 --description 'Isolated VDC network' \\\n"
    "            --dns1 8.8.8.8 --dns-suffix example.com \\\n"
    "            --ip-range-start 192.168.1.100 --ip-range-end 192.168.1.199 \\\n"
    "            --dhcp-enabled --default-lease-time 3600 \\\n"
    "            --max-lease-time 7200 --dhcp-ip-range-start 192.168.1.100 \\\n"
    "            --dhcp-ip-range-end 192.168.1.199\n"
    "        Create an isolated org vdc network with a DHCP service.\n"
    "\n"
    "    vcdnet network isolated list\n"
    "        List all isolated org vdc networks in the selected vdc.\n"
    "\n"
    "    vcdnet network isolated delete isolated-net1\n"
    "        Delete isolated network 'isolated-net1' in the selected vdc.\n";

static OptionSpec valueOption(const std::string& name, const std::string& shortName, const std::string& metavar,
                              const std::string& help, bool required = false) {
    OptionSpec option;
    option.name = name;
    option.shortName = shortName;
    option.kind = OptionKind::Value;
    option.required = required;
    option.metavar = metavar;
    option.help = help;
    return option;
}

static OptionSpec repeatableOption(const std::string& name, const std::string& shortName,
                                   const std::string& metavar, const std::string& help, bool required) {
    OptionSpec option = valueOption(name, shortName, metavar, help, required);
    option.kind = OptionKind::Repeatable;
    return option;
}

static OptionSpec flagOption(const std::string& name, const std::string& shortName, const std::string& help) {
    OptionSpec option;
    option.name = name;
    option.shortName = shortName;
    option.kind = OptionKind::Flag;
    option.help = help;
    return option;
}

static OptionSpec toggleOption(const std::string& name, const std::string& shortName,
                               const std::string& negatedName, const std::string& negatedShortName,
                               const std::string& help) {
    OptionSpec option;
    option.name = name;
    option.shortName = shortName;
    option.kind = OptionKind::Toggle;
    option.negatedName = negatedName;
    option.negatedShortName = negatedShortName;
    option.help = help;
    return option;
}

static std::vector<CommandSpec> buildCommandTable() {
    std::vector<CommandSpec> table;

    // network external
    {
        OptionSpec gateway = valueOption("--gateway", "-g", "<ip>", "Gateway of the subnet", true);
        gateway.aliases.push_back("--gateway-ip");

        table.push_back({"external", "create", "create a new external network",
            {{"name", "<name>"}, {"vc-name", "<vc-name>"}},
            {
                repeatableOption("--port-group", "-p", "<name>", "vCenter port group backing the network", true),
                gateway,
                valueOption("--netmask", "-n", "<netmask>", "Network mask of the subnet", true),
                repeatableOption("--ip-range", "-i", "<ip>",
                                 "IP range in StartAddress-EndAddress format", true),
                valueOption("--description", "-d", "<description>",
                            "Description of the external network to be created"),
                valueOption("--dns1", "", "<ip>", "IP of the primary DNS server of the subnet"),
                valueOption("--dns2", "", "<ip>", "IP of the secondary DNS server of the subnet"),
                valueOption("--dns-suffix", "", "<name>", "DNS suffix")
            },
            createExternalNetworkCommand});

        table.push_back({"external", "list", "list all external networks in the system",
            {}, {}, listExternalNetworksCommand});

        table.push_back({"external", "delete", "delete an external network",
            {{"name", "<name>"}},
            {
                flagOption("--yes", "-y", "Confirm the deletion without prompting")
            },
            deleteExternalNetworkCommand});

        table.push_back({"external", "update", "update name and description of an external network",
            {{"name", "<name>"}},
            {
                valueOption("--name", "-n", "<name>", "New name of the external network"),
                valueOption("--description", "-d", "<description>", "New description of the external network")
            },
            updateExternalNetworkCommand});
    }

    // network direct
    {
        table.push_back({"direct", "create", "create a new directly connected org vdc network in vcd",
            {{"name", "<name>"}},
            {
                valueOption("--parent", "-p", "<external network name>",
                            "Name of the external network to be connected to", true),
                valueOption("--description", "-d", "<description>", "Description of the network to be created"),
                toggleOption("--shared", "-s", "--not-shared", "-n",
                             "Share/Don't share the network with other VDC(s) in the organization")
            },
            createDirectNetworkCommand});

        table.push_back({"direct", "list", "list all directly connected org vdc networks in the selected vdc",
            {}, {}, listDirectNetworksCommand});

        table.push_back({"direct", "delete", "delete a directly connected org vdc network in the selected vdc",
            {{"name", "<name>"}},
            {
                flagOption("--force", "-f", "Force delete the org vdc network"),
                flagOption("--yes", "-y", "Confirm the deletion without prompting")
            },
            deleteDirectNetworkCommand});
    }

    // network isolated
    {
        OptionSpec gateway = valueOption("--gateway", "-g", "<ip>", "IP address of the gateway of the new network",
                                         true);
        gateway.aliases.push_back("--gateway-ip");

        table.push_back({"isolated", "create", "create a new isolated org vdc network in vcd",
            {{"name", "<name>"}},
            {
                gateway,
                valueOption("--netmask", "-n", "<netmask>", "Network mask for the gateway", true),
                valueOption("--description", "-d", "<description>", "Description of the network to be created"),
                valueOption("--dns1", "", "<ip>", "IP of the primary DNS server"),
                valueOption("--dns2", "", "<ip>", "IP of the secondary DNS server"),
                valueOption("--dns-suffix", "", "<name>", "DNS suffix"),
                valueOption("--ip-range-start", "", "<ip>",
                            "Start address of the IP range used for static pool allocation"),
                valueOption("--ip-range-end", "", "<ip>",
                            "End address of the IP range used for static pool allocation"),
                toggleOption("--dhcp-enabled", "", "--dhcp-disabled", "",
                             "Enable/Disable DHCP service on the new network"),
                valueOption("--default-lease-time", "", "<integer>", "Default lease in seconds for DHCP addresses"),
                valueOption("--max-lease-time", "", "<integer>", "Max lease in seconds for DHCP addresses"),
                valueOption("--dhcp-ip-range-start", "", "<ip>",
                            "Start address of the IP range used for DHCP addresses"),
                valueOption("--dhcp-ip-range-end", "", "<ip>",
                            "End address of the IP range used for DHCP addresses"),
                toggleOption("--shared", "", "--not-shared", "",
                             "Share/Don't share the network with other VDC(s) in the organization")
            },
            createIsolatedNetworkCommand});

        table.push_back({"isolated", "list", "list all isolated org vdc networks in the selected vdc",
            {}, {}, listIsolatedNetworksCommand});

        table.push_back({"isolated", "delete", "delete an isolated org vdc network in the selected vdc",
            {{"name", "<name>"}},
            {
                flagOption("--force", "-f", "Force delete the org vdc network"),
                flagOption("--yes", "-y", "Confirm the deletion without prompting")
            },
            deleteIsolatedNetworkCommand});
    }

    return table;
}

const std::vector<CommandGroup>& commandGroups() {
    static const std::vector<CommandGroup> groups = {
        {"external", "work with external networks", kExternalHelp},
        {"direct", "work with directly connected org vdc networks", kDirectHelp},
        {"isolated", "work with isolated org vdc networks", kIsolatedHelp}
    };
    return groups;
}

const std::vector<CommandSpec>& commandTable() {
    static const std::vector<CommandSpec> table = buildCommandTable();
    return table;
}

const CommandGroup* findCommandGroup(const std::string& group) {
    for (const auto& candidate : commandGroups()) {
        if (candidate.name == group) {
            return &candidate;
        }
    }
    return nullptr;
}

const CommandSpec* findCommand(const std::string& group, const std::string& name) {
    for (const auto& candidate : commandTable()) {
        if (candidate.group == group && candidate.name == name) {
            return &candidate;
        }
    }
    return nullptr;
}
