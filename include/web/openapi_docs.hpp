#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "server_config.hpp"

class OpenApiDocs
{
public:
  static std::string getSpec(const std::string &host, int port)
  {
    nlohmann::json spec = nlohmann::json::parse(R"JSON({
  "openapi": "3.0.0",
  "info": {
    "title": "Invoice Forensics API",
    "description": "Scores uploaded invoices for signs of tampering using error level analysis, EXIF inspection and OCR arithmetic checks"
  },
  "paths": {
    "/api/analyze": {
      "post": {
        "summary": "Analyze one invoice",
        "description": "Scores a JPG, PNG or PDF invoice (first page only). The upload is analyzed in memory; only the ELA visualization is stored.",
        "tags": ["Analysis"],
        "requestBody": {
          "required": true,
          "content": {
            "multipart/form-data": {
              "schema": {
                "type": "object",
                "properties": {
                  "file": {
                    "type": "string",
                    "format": "binary",
                    "description": "Invoice file (.jpg, .jpeg, .png or .pdf)"
                  }
                },
                "required": ["file"]
              }
            }
          }
        },
        "responses": {
          "200": {
            "description": "Fraud report",
            "content": {
              "application/json": {
                "schema": { "$ref": "#/components/schemas/FraudReport" }
              }
            }
          },
          "400": {
            "description": "Missing file, unsupported type or unreadable invoice",
            "content": {
              "application/json": {
                "schema": { "$ref": "#/components/schemas/Error" }
              }
            }
          },
          "413": { "description": "Upload larger than the configured limit" },
          "500": {
            "description": "Unexpected analysis error",
            "content": {
              "application/json": {
                "schema": { "$ref": "#/components/schemas/Error" }
              }
            }
          }
        }
      }
    },
    "/api/health": {
      "get": {
        "summary": "Service health",
        "tags": ["Service"],
        "responses": {
          "200": {
            "description": "Service is up",
            "content": {
              "application/json": {
                "schema": {
                  "type": "object",
                  "properties": {
                    "status": { "type": "string", "example": "ok" },
                    "ocr_available": { "type": "boolean" }
                  }
                }
              }
            }
          }
        }
      }
    },
    "/api/config": {
      "get": {
        "summary": "Active configuration",
        "tags": ["Service"],
        "responses": {
          "200": {
            "description": "Configuration loaded at startup",
            "content": {
              "application/json": {
                "schema": {
                  "type": "object",
                  "properties": {
                    "status": { "type": "string", "example": "success" },
                    "config": { "type": "object" }
                  }
                }
              }
            }
          }
        }
      }
    }
  },
  "components": {
    "schemas": {
      "Error": {
        "type": "object",
        "properties": { "error": { "type": "string" } }
      },
      "FraudReport": {
        "type": "object",
        "properties": {
          "final_score": { "type": "number", "minimum": 0, "maximum": 100 },
          "verdict": {
            "type": "string",
            "enum": ["HIGH RISK - Likely Tampered", "MEDIUM RISK - Requires Review", "LOW RISK - Appears Authentic"]
          },
          "ela": {
            "type": "object",
            "properties": {
              "score": { "type": "number" },
              "verdict": { "type": "string" },
              "visualization_path": { "type": "string", "nullable": true },
              "metrics": {
                "type": "object",
                "properties": {
                  "brightness_mean": { "type": "number" },
                  "brightness_variance": { "type": "number" },
                  "max_pixel_difference": { "type": "integer" },
                  "jpeg_quality": { "type": "integer" }
                }
              },
              "error": { "type": "string", "nullable": true }
            }
          },
          "metadata": {
            "type": "object",
            "properties": {
              "score": { "type": "number" },
              "verdict": { "type": "string" },
              "flags": { "type": "array", "items": { "type": "string" } },
              "metadata": { "type": "object", "additionalProperties": { "type": "string" } },
              "error": { "type": "string", "nullable": true }
            }
          },
          "ocr": {
            "type": "object",
            "properties": {
              "score": { "type": "number" },
              "verdict": { "type": "string" },
              "flags": { "type": "array", "items": { "type": "string" } },
              "extracted_text": { "type": "string" },
              "amounts": {
                "type": "array",
                "items": {
                  "type": "object",
                  "properties": {
                    "raw": { "type": "string" },
                    "value": { "type": "number" }
                  }
                }
              },
              "error": { "type": "string", "nullable": true }
            }
          }
        }
      }
    }
  }
})JSON");

    spec["info"]["version"] = ServerConfig::VERSION;
    spec["servers"] = nlohmann::json::array({{{"url", ServerConfig::getServerUrl(host, port)},
                                              {"description", "Configured server"}}});
    return spec.dump(2);
  }
};
