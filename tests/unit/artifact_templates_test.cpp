#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/backend/artifact_templates.hpp"
#include "support/fakes.hpp"

namespace {

using projmgr::backend::ArtifactWizard;
using projmgr::backend::HasGenerationMarker;
using projmgr::backend::kComposeGenerationMarker;
using projmgr::backend::kUnitGenerationMarker;
using projmgr::backend::ParseDockerfile;
using projmgr::backend::SynthesizeCompose;
using projmgr::testing::ScriptedPrompter;
using projmgr::testing::TempDir;
using projmgr::testing::WriteFile;

constexpr char kDockerfile[] =
    "FROM node:22-alpine3.20\n"
    "WORKDIR /usr/src/app\n"
    "EXPOSE 8700\n"
    "EXPOSE 8080 80\n"
    "ENV NODE_ENV production\n"
    "ENV  PORT=8700\n"
    "ENVIRONMENT is not an instruction\n";

void TestParseDockerfile() {
  const auto declarations = ParseDockerfile(kDockerfile);
  assert(declarations.ports.size() == 2);
  assert(declarations.ports[0] == "8700");
  assert(declarations.ports[1] == "8080:80");
  assert(declarations.environment.size() == 2);
  assert(declarations.environment[0] == "NODE_ENV=production");
  assert(declarations.environment[1] == "PORT=8700");
}

void TestSynthesizedComposeIsDeterministic() {
  const auto first  = SynthesizeCompose("shop", "/srv/shop", kDockerfile);
  const auto second = SynthesizeCompose("shop", "/srv/shop", kDockerfile);
  assert(first == second);

  assert(first.rfind(std::string(kComposeGenerationMarker) + "\n", 0) == 0);
  assert(first.find("  shop:\n") != std::string::npos);
  assert(first.find("    build: /srv/shop\n") != std::string::npos);
  assert(first.find("    container_name: shop\n") != std::string::npos);
  assert(first.find("      - \"8080:80\"\n") != std::string::npos);
  assert(first.find("      - NODE_ENV=production\n") != std::string::npos);
  assert(first.find("    restart: always\n") != std::string::npos);

  // No declarations leave commented examples behind.
  const auto bare = SynthesizeCompose("shop", "/srv/shop", "FROM scratch\n");
  assert(bare.find("#    ports:") != std::string::npos);
  assert(bare.find("    ports:\n") == std::string::npos);
}

void TestGenerationMarkerDetection() {
  TempDir dir("templates_marker");
  WriteFile(dir / "generated.yml", SynthesizeCompose("shop", "/srv/shop", kDockerfile));
  WriteFile(dir / "custom.yml", "services:\n  shop:\n    image: acme/shop\n");

  assert(HasGenerationMarker(dir / "generated.yml", kComposeGenerationMarker));
  assert(!HasGenerationMarker(dir / "custom.yml", kComposeGenerationMarker));
  assert(!HasGenerationMarker(dir / "missing.yml", kComposeGenerationMarker));
}

void TestWizardDockerfile() {
  TempDir dir("templates_wizard_dockerfile");
  WriteFile(dir / "package.json", "{}\n");

  auto prompter = std::make_shared<ScriptedPrompter>();
  prompter->Confirms(true).Answers("").Answers("8700:8700").Answers("NODE_ENV=production").Answers("");

  ArtifactWizard wizard(prompter);
  const auto     dockerfile = wizard.Dockerfile(dir.path(), "node:22-alpine3.20");
  assert(dockerfile);
  assert(dockerfile->rfind("FROM node:22-alpine3.20\n", 0) == 0);
  assert(dockerfile->find("RUN npm install\n") != std::string::npos);
  assert(dockerfile->find("ENTRYPOINT [\"npm\", \"start\"]\n") != std::string::npos);
  assert(dockerfile->find("EXPOSE 8700:8700\n") != std::string::npos);
  assert(dockerfile->find("ENV NODE_ENV=production\n") != std::string::npos);

  // The answers flow into the synthesized compose file.
  const auto compose = SynthesizeCompose("web", dir.path(), *dockerfile);
  assert(compose.find("      - \"8700:8700\"\n") != std::string::npos);
}

void TestWizardCanBeDeclined() {
  auto           prompter = std::make_shared<ScriptedPrompter>();
  ArtifactWizard wizard(prompter);
  assert(!wizard.Dockerfile("/srv/shop", "node:22-alpine3.20"));
  assert(!wizard.UnitFile("shop", "/srv/shop"));
  assert(prompter->questions.size() == 2);
}

void TestWizardUnitFile() {
  auto prompter = std::make_shared<ScriptedPrompter>();
  prompter->Confirms(true).Answers("/usr/bin/node index.js").Answers("PORT=9000").Answers("");

  ArtifactWizard wizard(prompter);
  const auto     unit = wizard.UnitFile("shop", "/srv/shop");
  assert(unit);
  assert(unit->rfind(std::string(kUnitGenerationMarker) + "\n", 0) == 0);
  assert(unit->find("WorkingDirectory=/srv/shop\n") != std::string::npos);
  assert(unit->find("ExecStart=/usr/bin/node index.js\n") != std::string::npos);
  assert(unit->find("Environment=\"PORT=9000\"\n") != std::string::npos);
  assert(unit->find("WantedBy=multi-user.target\n") != std::string::npos);
}

} // namespace

int main() {
  TestParseDockerfile();
  TestSynthesizedComposeIsDeterministic();
  TestGenerationMarkerDetection();
  TestWizardDockerfile();
  TestWizardCanBeDeclined();
  TestWizardUnitFile();

  std::cout << "projmgr_unit_artifact_templates: pass\n";
  return 0;
}
