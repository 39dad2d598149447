#pragma once

// Chinese string table - included by i18n.hpp after Strings is defined

inline constexpr Strings ZH_STRINGS_DEF = {
    // General
    "svpanel",
    "确认",
    "取消",

    // Service status
    "已停止",
    "启动中",
    "运行中",
    "停止中",
    "错误",

    // Actions
    "启动",
    "停止",
    "重启",
    "刷新",
    "结束占用端口的进程",
    "退出",
    "语言",

    // Status bar
    "进程",
    "端口",
    "已接管",
    "自启动",
    "最近错误",
    "端口被占用",

    // Notifications
    "服务已就绪",
    "服务启动失败",
    "服务已停止",
    "端口被其他进程占用",
    "端口已释放",

    // Quit dialog
    "退出",
    "服务仍在运行。",
    "停止服务并退出",
    "保持运行并退出",
    "正在停止服务...",

    // Log panel
    "全部",
    "管理器",
    "服务",
    "已冻结",
    "实时",
    "导出",
    "日志已导出到",
    "(无日志)",
};
