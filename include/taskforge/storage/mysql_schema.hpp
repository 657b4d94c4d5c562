#pragma once

#include <string_view>

namespace taskforge::schema {

// MySQL 8 schema, version 1. Timestamps are Unix milliseconds (BIGINT);
// JSON documents are kept as text and parsed at the store boundary.

inline constexpr int CURRENT_SCHEMA_VERSION = 1;

inline constexpr std::string_view V1_SCHEMA = R"SQL(

CREATE TABLE IF NOT EXISTS schema_version (
    version INT NOT NULL PRIMARY KEY,
    applied_at DATETIME DEFAULT CURRENT_TIMESTAMP
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS tasks (
    id BIGINT AUTO_INCREMENT PRIMARY KEY,
    user_id BIGINT NOT NULL DEFAULT 0,
    user_name VARCHAR(255) NOT NULL DEFAULT '',
    title VARCHAR(512) NOT NULL DEFAULT '',
    status VARCHAR(32) NOT NULL DEFAULT 'PENDING',
    progress INT NOT NULL DEFAULT 0,
    error_message TEXT NOT NULL,
    result MEDIUMTEXT NOT NULL,
    team_id BIGINT NOT NULL DEFAULT 0,
    git_url VARCHAR(1024) NOT NULL DEFAULT '',
    git_repo VARCHAR(512) NOT NULL DEFAULT '',
    git_repo_id BIGINT NOT NULL DEFAULT 0,
    git_domain VARCHAR(255) NOT NULL DEFAULT '',
    branch_name VARCHAR(255) NOT NULL DEFAULT '',
    type VARCHAR(32) NOT NULL DEFAULT 'online',
    additional_skills TEXT NOT NULL,
    model_id VARCHAR(255) NOT NULL DEFAULT '',
    force_override_model TINYINT NOT NULL DEFAULT 0,
    force_override_model_type VARCHAR(32) NOT NULL DEFAULT '',
    version BIGINT NOT NULL DEFAULT 0,
    created_at BIGINT NOT NULL,
    updated_at BIGINT NOT NULL,
    completed_at BIGINT NOT NULL DEFAULT 0,
    INDEX idx_tasks_status_created (status, created_at)
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS subtasks (
    id BIGINT AUTO_INCREMENT PRIMARY KEY,
    task_id BIGINT NOT NULL,
    user_id BIGINT NOT NULL DEFAULT 0,
    title VARCHAR(512) NOT NULL DEFAULT '',
    role VARCHAR(16) NOT NULL DEFAULT 'ASSISTANT',
    message_id BIGINT NOT NULL DEFAULT 0,
    status VARCHAR(32) NOT NULL DEFAULT 'PENDING',
    progress INT NOT NULL DEFAULT 0,
    prompt MEDIUMTEXT NOT NULL,
    result MEDIUMTEXT NOT NULL,
    error_message TEXT NOT NULL,
    bot_ids TEXT NOT NULL,
    executor_name VARCHAR(255) NOT NULL DEFAULT '',
    executor_namespace VARCHAR(255) NOT NULL DEFAULT '',
    created_at BIGINT NOT NULL,
    updated_at BIGINT NOT NULL,
    completed_at BIGINT NOT NULL DEFAULT 0,
    INDEX idx_subtasks_sequence (task_id, message_id, created_at),
    INDEX idx_subtasks_status (status),
    CONSTRAINT fk_subtask_task FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE CASCADE
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS resources (
    id BIGINT AUTO_INCREMENT PRIMARY KEY,
    user_id BIGINT NOT NULL DEFAULT 0,
    kind VARCHAR(32) NOT NULL,
    name VARCHAR(255) NOT NULL,
    namespace VARCHAR(255) NOT NULL DEFAULT 'default',
    json MEDIUMTEXT NOT NULL,
    is_active TINYINT NOT NULL DEFAULT 1,
    created_at BIGINT NOT NULL,
    updated_at BIGINT NOT NULL,
    UNIQUE KEY uq_resource (kind, user_id, name, namespace),
    INDEX idx_resources_name (kind, name, namespace)
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS users (
    id BIGINT AUTO_INCREMENT PRIMARY KEY,
    name VARCHAR(255) NOT NULL,
    git_info MEDIUMTEXT NOT NULL,
    is_active TINYINT NOT NULL DEFAULT 1
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

)SQL";

} // namespace taskforge::schema
