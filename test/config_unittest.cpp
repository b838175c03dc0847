#include "glog/logging.h"
#include "gtest/gtest.h"

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <string>
#include <vector>

#include "helper.hpp"
#include "mgmt_common.hpp"
#include "mgmt_error.hpp"
#include "mgmt_config.hpp"
#include "mgmt_definitions.hpp"
#include "mgmt_transport_remote.hpp"
#include "mgmt_property_client.hpp"
#include "loopback_link.hpp"

using namespace mgmt;

const char* full_config =
  "{ \"common\":  { \"TIMEOUT\": 1500, \"TRACE\": 2 },\n"
  "  \"remote\":  { \"ENDPOINT\": \"tcp://gateway:5560\", \"DEVICE\": \"1.1.4\",\n"
  "                \"CONNECTION_ORIENTED\": 1, \"KEY\": \"FFFFFFFF\" },\n"
  "  \"local\":   { \"ENDPOINT\": \"tcp://device:5561\" },\n"
  "  \"scan\":    { \"OBJECT_INDEX\": 3, \"PID\": 52 },\n"
  "  \"definitions\": \"properties.json\" }\n";

const char* definitions_text =
  "{ \"properties\": [\n"
  "  { \"object_type\": -1, \"pid\": 56, \"name\": \"Max. APDU length\",\n"
  "    \"pid_name\": \"MAX_APDULENGTH\", \"pdt\": 4, \"dpt\": \"7.001\", \"read_only\": true },\n"
  "  { \"pid\": 13, \"name\": \"Program version\", \"pdt\": 21 },\n"
  "  { \"object_type\": 0, \"pid\": 120, \"name\": \"Active energy\", \"dpt\": \"29.010\", \"read_only\": 0 }\n"
  "] }\n";

// Временный каталог с файлами конфигурации
class TempDir
{
  public:
    TempDir() : m_path()
    {
      char templ[] = "/tmp/knxmgmt_cfg_XXXXXX";
      if (mkdtemp(templ))
        m_path = templ;
    };

   ~TempDir()
    {
      for (size_t i = 0; i < m_files.size(); i++)
        unlink(m_files[i].c_str());
      if (!m_path.empty())
        rmdir(m_path.c_str());
    };

    const std::string& path() const { return m_path; };

    std::string write(const std::string& name, const char* content)
    {
      const std::string filename = m_path + "/" + name;
      FILE* file = fopen(filename.c_str(), "w");
      if (file)
      {
        fputs(content, file);
        fclose(file);
        m_files.push_back(filename);
      }
      return filename;
    };

  private:
    std::string m_path;
    std::vector<std::string> m_files;
};

// ==========================================================================
TEST(TestCOMMON, ADDRESSES)
{
  int address = -1;

  EXPECT_EQ(address_to_string(0x1104), "1.1.4");
  EXPECT_EQ(address_to_string(0xFFFF), "15.15.255");

  ASSERT_TRUE(parse_individual_address("1.1.4", address));
  EXPECT_EQ(address, 0x1104);
  ASSERT_TRUE(parse_individual_address(" 15.15.255 ", address));
  EXPECT_EQ(address, 0xFFFF);
  ASSERT_TRUE(parse_individual_address("4356", address));
  EXPECT_EQ(address, 0x1104);
  ASSERT_TRUE(parse_individual_address("0x1105", address));
  EXPECT_EQ(address, 0x1105);

  EXPECT_FALSE(parse_individual_address("", address));
  EXPECT_FALSE(parse_individual_address("16.0.0", address));
  EXPECT_FALSE(parse_individual_address("1.16.0", address));
  EXPECT_FALSE(parse_individual_address("1.1.256", address));
  EXPECT_FALSE(parse_individual_address("1.1", address));
  EXPECT_FALSE(parse_individual_address("1.1.4x", address));
  EXPECT_FALSE(parse_individual_address("65536", address));
  EXPECT_FALSE(parse_individual_address("gateway", address));
}

TEST(TestCOMMON, HEX)
{
  std::string bytes;

  ASSERT_TRUE(hex_to_bytes("FF00a1", bytes));
  EXPECT_EQ(bytes, std::string("\xFF\x00\xA1", 3));
  ASSERT_TRUE(hex_to_bytes("12 34", bytes));
  EXPECT_EQ(bytes, std::string("\x12\x34", 2));
  EXPECT_FALSE(hex_to_bytes("123", bytes));
  EXPECT_FALSE(hex_to_bytes("12G4", bytes));

  EXPECT_EQ(hex_dump(std::string("abc")), "[003] abc");
  EXPECT_EQ(hex_dump(std::string("\x00\x37", 2)), "[002] 0037");
  EXPECT_EQ(trim("  1.1.4\t\n"), "1.1.4");
}

// ==========================================================================
TEST(TestCONFIG, DEFAULTS)
{
  ClientConfig config("");

  ASSERT_TRUE(config.parse("{}").Ok());
  EXPECT_EQ(config.timeout(), RESPONSE_TIMEOUT_MSEC);
  EXPECT_EQ(config.trace_level(), 0);
  EXPECT_TRUE(config.remote_endpoint().empty());
  EXPECT_EQ(config.device_address(), -1);
  EXPECT_FALSE(config.connection_oriented());
  EXPECT_TRUE(config.key().empty());
  EXPECT_TRUE(config.local_endpoint().empty());
  EXPECT_EQ(config.count_object_index(), DEFAULT_OBJECT_COUNT_INDEX);
  EXPECT_EQ(config.count_pid(), PID_IO_LIST);
  EXPECT_TRUE(config.definitions_filename().empty());
}

TEST(TestCONFIG, PARSE_FULL)
{
  ClientConfig config("");

  ASSERT_TRUE(config.parse(full_config).Ok());
  EXPECT_EQ(config.timeout(), 1500);
  EXPECT_EQ(config.trace_level(), 2);
  EXPECT_EQ(config.remote_endpoint(), "tcp://gateway:5560");
  EXPECT_EQ(config.device_address(), 0x1104);
  EXPECT_TRUE(config.connection_oriented());
  EXPECT_EQ(config.key(), std::string("\xFF\xFF\xFF\xFF", 4));
  EXPECT_EQ(config.local_endpoint(), "tcp://device:5561");
  EXPECT_EQ(config.count_object_index(), 3);
  EXPECT_EQ(config.count_pid(), 52);
  // Без файла путь не преобразуется
  EXPECT_EQ(config.definitions_filename(), "properties.json");

  // Повторный разбор начинается со значений по умолчанию
  ASSERT_TRUE(config.parse("{ \"remote\": { \"DEVICE\": 4357, \"CONNECTION_ORIENTED\": false } }").Ok());
  EXPECT_EQ(config.device_address(), 0x1105);
  EXPECT_FALSE(config.connection_oriented());
  EXPECT_EQ(config.timeout(), RESPONSE_TIMEOUT_MSEC);
  EXPECT_TRUE(config.definitions_filename().empty());
}

TEST(TestCONFIG, ERRORS)
{
  ClientConfig config("");
  const char* wrong[] = {
    "",
    "{ \"common\": ",
    "[1, 2]",
    "{ \"common\": 5 }",
    "{ \"common\": { \"TIMEOUT\": 0 } }",
    "{ \"common\": { \"TIMEOUT\": \"fast\" } }",
    "{ \"remote\": { \"DEVICE\": \"16.1.1\" } }",
    "{ \"remote\": { \"DEVICE\": 70000 } }",
    "{ \"remote\": { \"DEVICE\": true } }",
    "{ \"remote\": { \"KEY\": \"XYZ\" } }",
    "{ \"remote\": { \"CONNECTION_ORIENTED\": \"yes\" } }",
    "{ \"local\": { \"ENDPOINT\": 5561 } }",
    "{ \"scan\": { \"OBJECT_INDEX\": 256 } }",
    "{ \"scan\": { \"PID\": 0 } }",
    "{ \"definitions\": 1 }",
    NULL
  };

  for (const char** text = wrong; *text; text++)
    EXPECT_EQ(config.parse(*text).code(), rtE_CONFIG) << *text;

  EXPECT_EQ(config.parse(NULL).code(), rtE_CONFIG);
}

TEST(TestCONFIG, LOAD_FILE)
{
  TempDir dir;
  ASSERT_FALSE(dir.path().empty());

  const std::string config_name = dir.write("client.json", full_config);
  const std::string definitions_name = dir.write("properties.json", definitions_text);

  ClientConfig config(config_name);
  ASSERT_TRUE(config.load().Ok());
  EXPECT_EQ(config.device_address(), 0x1104);
  // Относительный путь отсчитывается от каталога конфигурации
  EXPECT_EQ(config.definitions_filename(), definitions_name);

  Definitions defs;
  ASSERT_TRUE(load_definitions(config.definitions_filename(), defs).Ok());
  EXPECT_EQ(defs.size(), 3U);

  // Абсолютный путь не изменяется
  const std::string absolute = dir.write("absolute.json", "{ \"definitions\": \"/etc/knxmgmt/properties.json\" }");
  ClientConfig absolute_config(absolute);
  ASSERT_TRUE(absolute_config.load().Ok());
  EXPECT_EQ(absolute_config.definitions_filename(), "/etc/knxmgmt/properties.json");
}

TEST(TestCONFIG, LOAD_ERRORS)
{
  TempDir dir;
  ASSERT_FALSE(dir.path().empty());

  ClientConfig missing(dir.path() + "/missing.json");
  EXPECT_EQ(missing.load().code(), rtE_CONFIG);

  ClientConfig empty(dir.write("empty.json", ""));
  EXPECT_EQ(empty.load().code(), rtE_CONFIG);

  ClientConfig broken(dir.write("broken.json", "{ \"common\": { \"TIMEOUT\": 100 "));
  EXPECT_EQ(broken.load().code(), rtE_CONFIG);
}

// ==========================================================================
TEST(TestDEFINITIONS, PARSE)
{
  Definitions defs;

  ASSERT_TRUE(parse_definitions(definitions_text, defs).Ok());
  ASSERT_EQ(defs.size(), 3U);

  const PropertyDefinition& apdu = defs.at(PropertyKey(OBJECT_TYPE_GLOBAL, PID_MAX_APDULENGTH));
  EXPECT_EQ(apdu.name, "Max. APDU length");
  EXPECT_EQ(apdu.pid_name, "MAX_APDULENGTH");
  EXPECT_EQ(apdu.pdt, PDT_UNSIGNED_INT);
  EXPECT_EQ(apdu.dpt, "7.001");
  EXPECT_TRUE(apdu.read_only);

  // Значения по умолчанию
  const PropertyDefinition& version = defs.at(PropertyKey(OBJECT_TYPE_GLOBAL, PID_PROGRAM_VERSION));
  EXPECT_EQ(version.object_type, OBJECT_TYPE_GLOBAL);
  EXPECT_EQ(version.pdt, PDT_GENERIC_05);
  EXPECT_TRUE(version.dpt.empty());
  EXPECT_TRUE(version.pid_name.empty());
  EXPECT_FALSE(version.read_only);

  const PropertyDefinition& energy = defs.at(PropertyKey(OT_DEVICE, 120));
  EXPECT_EQ(energy.dpt, "29.010");
  EXPECT_EQ(energy.pdt, PDT_UNKNOWN);
  EXPECT_FALSE(energy.read_only);
}

TEST(TestDEFINITIONS, OVERRIDE)
{
  Definitions defs;

  ASSERT_TRUE(parse_definitions(definitions_text, defs).Ok());
  ASSERT_TRUE(parse_definitions("{ \"properties\": [ { \"pid\": 56, \"dpt\": \"7.002\" } ] }", defs).Ok());

  EXPECT_EQ(defs.size(), 3U);
  EXPECT_EQ(defs.at(PropertyKey(OBJECT_TYPE_GLOBAL, PID_MAX_APDULENGTH)).dpt, "7.002");
  EXPECT_TRUE(defs.at(PropertyKey(OBJECT_TYPE_GLOBAL, PID_MAX_APDULENGTH)).name.empty());
}

TEST(TestDEFINITIONS, MALFORMED)
{
  Definitions defs;
  const char* wrong[] = {
    "",
    "{ \"properties\": [ ",
    "{ }",
    "{ \"properties\": {} }",
    "{ \"properties\": [ 5 ] }",
    "{ \"properties\": [ { \"name\": \"no pid\" } ] }",
    "{ \"properties\": [ { \"pid\": \"13\" } ] }",
    "{ \"properties\": [ { \"pid\": 13, \"object_type\": \"device\" } ] }",
    "{ \"properties\": [ { \"pid\": 13, \"pdt\": \"GENERIC_05\" } ] }",
    "{ \"properties\": [ { \"pid\": 13, \"dpt\": 29 } ] }",
    "{ \"properties\": [ { \"pid\": 13, \"read_only\": \"no\" } ] }",
    NULL
  };

  ASSERT_TRUE(parse_definitions(definitions_text, defs).Ok());

  for (const char** text = wrong; *text; text++)
    EXPECT_EQ(parse_definitions(*text, defs).code(), rtE_CONFIG) << *text;

  // Ошибка во втором элементе: первый тоже не добавляется
  EXPECT_EQ(parse_definitions("{ \"properties\": [ { \"pid\": 200 }, { \"pid\": \"x\" } ] }", defs).code(),
            rtE_CONFIG);
  EXPECT_EQ(defs.size(), 3U);
  EXPECT_EQ(defs.count(PropertyKey(OBJECT_TYPE_GLOBAL, 200)), 0U);

  EXPECT_EQ(load_definitions("/nonexistent/properties.json", defs).code(), rtE_CONFIG);
}

TEST(TestDEFINITIONS, CLIENT_CONFIGURE)
{
  TempDir dir;
  ASSERT_FALSE(dir.path().empty());

  dir.write("properties.json", definitions_text);
  ClientConfig config(dir.write("client.json", full_config));
  ASSERT_TRUE(config.load().Ok());

  sim::LoopbackLink link("loopback");
  PropertyClient client(new RemoteTransport(&link, config.device_address(), NULL,
                                            config.connection_oriented(), config.key()));

  ASSERT_TRUE(client.configure(config).Ok());
  EXPECT_EQ(client.transport()->timeout(), 1500);
  EXPECT_EQ(client.definitions().size(), 3U);
  ASSERT_TRUE(client.find_definition(OT_DEVICE, PID_MAX_APDULENGTH) != NULL);
  EXPECT_EQ(client.find_definition(OT_DEVICE, PID_MAX_APDULENGTH)->dpt, "7.001");

  // Файл определений не найден
  ClientConfig wrong("");
  ASSERT_TRUE(wrong.parse("{ \"definitions\": \"/nonexistent/properties.json\" }").Ok());
  EXPECT_EQ(client.configure(wrong).code(), rtE_CONFIG);
}

int main(int argc, char** argv)
{
  ::google::InitGoogleLogging(argv[0]);
  ::testing::InitGoogleTest(&argc, argv);
  ::google::InstallFailureSignalHandler();

  int retval = RUN_ALL_TESTS();

  ::google::ShutdownGoogleLogging();
  return retval;
}
