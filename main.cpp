/*
 * This file is part of Tallysheet.
 * Copyright (C) 2025 Luisma Peramato
 *
 * Tallysheet is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Tallysheet is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Tallysheet. If not, see <https://www.gnu.org/licenses/>.
 */
#include "clientid.h"
#include "configmanager.h"
#include "documentlayout.h"
#include "jobloader.h"
#include "logger.h"
#include "sheetgenerator.h"

#include <iostream>
#include <wx/cmdline.h>
#include <wx/init.h>

namespace {

const wxCmdLineEntryDesc kCommandLine[] = {
    {wxCMD_LINE_SWITCH, "h", "help", "show this help", wxCMD_LINE_VAL_NONE,
     wxCMD_LINE_OPTION_HELP},
    {wxCMD_LINE_OPTION, "j", "job", "JSON job file with client and products",
     wxCMD_LINE_VAL_STRING, 0},
    {wxCMD_LINE_OPTION, nullptr, "client-id",
     "client identifier (random when omitted)", wxCMD_LINE_VAL_STRING, 0},
    {wxCMD_LINE_OPTION, nullptr, "client-name", "client display name",
     wxCMD_LINE_VAL_STRING, 0},
    {wxCMD_LINE_OPTION, "p", "product", "product as NAME=ID (repeatable)",
     wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_MULTIPLE},
    {wxCMD_LINE_OPTION, "c", "config", "configuration file to load",
     wxCMD_LINE_VAL_STRING, 0},
    {wxCMD_LINE_OPTION, nullptr, "write-config",
     "write the effective configuration to a file", wxCMD_LINE_VAL_STRING, 0},
    {wxCMD_LINE_OPTION, "r", "regions", "write scanner regions as JSON",
     wxCMD_LINE_VAL_STRING, 0},
    {wxCMD_LINE_OPTION, nullptr, "dpi", "pixel density of the region map",
     wxCMD_LINE_VAL_DOUBLE, 0},
    {wxCMD_LINE_SWITCH, nullptr, "capacity",
     "print how many product rows fit on one sheet", wxCMD_LINE_VAL_NONE, 0},
    {wxCMD_LINE_PARAM, nullptr, nullptr, "output.pdf", wxCMD_LINE_VAL_STRING,
     wxCMD_LINE_PARAM_OPTIONAL},
    {wxCMD_LINE_NONE, nullptr, nullptr, nullptr, wxCMD_LINE_VAL_NONE, 0}};

int Run(wxCmdLineParser &parser) {
  Logger &log = Logger::Instance();
  ConfigManager &cfg = ConfigManager::Get();
  if (!cfg.LoadUserConfig())
    log.Log("No user configuration loaded from " +
            ConfigManager::GetUserConfigFile());

  wxString value;
  if (parser.Found("config", &value)) {
    const std::string path = value.ToStdString();
    if (!cfg.LoadFromFile(path)) {
      log.Error("Unable to load configuration file " + path);
      return kExitValidation;
    }
    log.Log("Loaded configuration " + path);
  }

  if (parser.Found("write-config", &value)) {
    const std::string path = value.ToStdString();
    if (!cfg.SaveToFile(path)) {
      log.Error("Unable to write configuration file " + path);
      return kExitIo;
    }
    log.Log("Wrote configuration " + path);
  }

  SheetGenerationOptions options = SheetGenerationOptions::FromConfig(cfg);

  if (parser.Found("capacity")) {
    const sheet::PageGeometry page = sheet::PageGeometry::FromPageSetup(
        options.pageSetup, options.layout.markerSize);
    try {
      sheet::ValidateLayoutConfig(options.layout, page);
    } catch (const ValidationError &ex) {
      log.Error(ex.what());
      return kExitValidation;
    }
    std::cout << sheet::ComputeRowCapacity(options.layout, page) << std::endl;
    return kExitOk;
  }

  if (parser.GetParamCount() == 0) {
    if (parser.Found("write-config"))
      return kExitOk;
    parser.Usage();
    return kExitValidation;
  }
  const std::string outputPath = parser.GetParam(0).ToStdString();

  SheetJob job;
  try {
    if (parser.Found("job", &value))
      job = LoadSheetJob(value.ToStdString());
    for (const wxCmdLineArg &arg : parser.GetArguments()) {
      if (arg.GetKind() == wxCMD_LINE_OPTION && arg.GetLongName() == "product")
        job.products.push_back(
            ParseProductArgument(arg.GetStrVal().ToStdString()));
    }
  } catch (const ValidationError &ex) {
    log.Error(ex.what());
    return kExitValidation;
  }
  if (parser.Found("client-id", &value))
    job.client.id = value.ToStdString();
  if (parser.Found("client-name", &value))
    job.client.name = value.ToStdString();
  if (job.client.id.empty()) {
    job.client.id = GenerateClientId();
    log.Log("Generated client id " + job.client.id);
  }

  if (parser.Found("regions", &value))
    options.regionMapPath = value.ToStdString();
  double dpi = 0.0;
  if (parser.Found("dpi", &dpi))
    options.regionDpi = dpi;

  const SheetExportResult result = GenerateDocument(job, outputPath, options);
  if (!result.success) {
    std::cerr << "tallysheet: " << result.message << std::endl;
    return SheetErrorExitCode(result.errorKind);
  }
  std::cout << result.message << std::endl;
  return kExitOk;
}

} // namespace

int main(int argc, char **argv) {
  wxInitializer initializer(argc, argv);
  if (!initializer.IsOk()) {
    std::cerr << "tallysheet: failed to initialize wxWidgets" << std::endl;
    return kExitFailure;
  }

  wxCmdLineParser parser(kCommandLine, argc, argv);
  parser.SetLogo("tallysheet - printable inventory audit sheets");
  switch (parser.Parse()) {
  case -1:
    return kExitOk;
  case 0:
    break;
  default:
    return kExitValidation;
  }

  const int code = Run(parser);
  Logger::Instance().Flush();
  return code;
}
